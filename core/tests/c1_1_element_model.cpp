// C1.1 — Element model: construction, kind access, patch merge and snapshot

#include "cf/canvas/Element.hpp"

#include <cstdio>
#include <cstdlib>
#include <string>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) { std::fprintf(stderr, "ASSERT FAIL: %s\n", msg); std::exit(1); }
}

int main() {
  // ---- Test 1: constructors and defaults ----
  {
    cf::Element a = cf::makeAssetElement("e1", "a1", 10, 20, 100, 50, 3);
    requireTrue(cf::isAsset(a), "asset kind");
    requireTrue(!cf::isText(a), "asset is not text");
    requireTrue(cf::assetContent(a) != nullptr, "asset payload");
    requireTrue(cf::textContent(a) == nullptr, "no text payload on asset");
    requireTrue(cf::assetContent(a)->assetId == "a1", "assetId");
    requireTrue(a.zIndex == 3, "zIndex");
    requireTrue(a.opacity == 1.0, "opacity defaults to 1");
    requireTrue(!a.locked, "unlocked by default");
    requireTrue(a.rotation == 0.0, "no rotation by default");

    cf::Element t = cf::makeTextElement("e2", "Hello", 0, 0, 200, 40);
    requireTrue(cf::isText(t), "text kind");
    const cf::TextContent* tc = cf::textContent(t);
    requireTrue(tc != nullptr, "text payload");
    requireTrue(tc->fontSize == 24, "default fontSize");
    requireTrue(tc->fontFamily == "Arial, sans-serif", "default fontFamily");
    requireTrue(tc->color == "#000000", "default color");
    requireTrue(tc->backgroundColor.empty(), "no background by default");
    requireTrue(tc->textAlign == cf::TextAlign::Center, "center aligned by default");
    requireTrue(tc->fontWeight == cf::FontWeight::Normal, "normal weight");
    requireTrue(tc->fontStyle == cf::FontStyle::Normal, "normal style");
    requireTrue(std::string(cf::elementKindName(cf::kindOf(t))) == "text", "kind name");
    std::printf("  Test 1 (constructors and defaults): PASS\n");
  }

  // ---- Test 2: applyPatch sets only present fields ----
  {
    cf::Element t = cf::makeTextElement("t", "Hi", 0, 0, 100, 40);
    cf::ElementPatch p;
    p.x = 5;
    p.opacity = 0.5;
    p.text = std::string("Bye");
    p.textAlign = cf::TextAlign::Right;
    cf::applyPatch(t, p);
    requireTrue(t.x == 5, "x patched");
    requireTrue(t.y == 0, "y untouched");
    requireTrue(t.opacity == 0.5, "opacity patched");
    requireTrue(cf::textContent(t)->text == "Bye", "text patched");
    requireTrue(cf::textContent(t)->textAlign == cf::TextAlign::Right, "align patched");
    requireTrue(cf::textContent(t)->fontSize == 24, "fontSize untouched");
    std::printf("  Test 2 (applyPatch partial): PASS\n");
  }

  // ---- Test 3: patch cannot change kind; other-kind fields ignored ----
  {
    cf::Element a = cf::makeAssetElement("a", "img", 0, 0, 10, 10);
    cf::ElementPatch p;
    p.text = std::string("ignored");
    p.color = std::string("#ff0000");
    p.assetId = std::string("img2");
    cf::applyPatch(a, p);
    requireTrue(cf::isAsset(a), "still asset");
    requireTrue(cf::assetContent(a)->assetId == "img2", "assetId patched");

    cf::Element t = cf::makeTextElement("t", "x", 0, 0, 10, 10);
    cf::ElementPatch q;
    q.assetId = std::string("img");
    cf::applyPatch(t, q);
    requireTrue(cf::isText(t), "still text");
    requireTrue(cf::textContent(t)->text == "x", "text unchanged");
    std::printf("  Test 3 (kind is immutable): PASS\n");
  }

  // ---- Test 4: snapshotPatch captures exactly the masked fields ----
  {
    cf::Element t = cf::makeTextElement("t", "old", 1, 2, 30, 40);
    cf::ElementPatch mask;
    mask.x = 99;
    mask.text = std::string("new");
    mask.assetId = std::string("other-kind");

    cf::ElementPatch snap = cf::snapshotPatch(t, mask);
    requireTrue(snap.x && *snap.x == 1, "x captured with current value");
    requireTrue(snap.text && *snap.text == "old", "text captured with current value");
    requireTrue(!snap.y, "y not captured");
    requireTrue(!snap.assetId, "asset field skipped on text");

    cf::applyPatch(t, mask);
    cf::applyPatch(t, snap);
    requireTrue(t.x == 1 && cf::textContent(t)->text == "old", "snapshot restores");
    std::printf("  Test 4 (snapshotPatch): PASS\n");
  }

  // ---- Test 5: equality and empty patch ----
  {
    cf::Element a = cf::makeAssetElement("a", "img", 0, 0, 10, 10);
    cf::Element b = a;
    requireTrue(a == b, "copies equal");
    b.locked = true;
    requireTrue(a != b, "locked differs");

    cf::Element t = cf::makeTextElement("a", "", 0, 0, 10, 10);
    requireTrue(a != t, "different kinds differ");

    cf::ElementPatch p;
    requireTrue(p.empty(), "default patch is empty");
    p.zIndex = 0;
    requireTrue(!p.empty(), "patch with zIndex is not empty");

    requireTrue(cf::isBold(cf::FontWeight::Bold), "bold is bold");
    requireTrue(cf::isBold(cf::FontWeight::W700), "700 is bold");
    requireTrue(!cf::isBold(cf::FontWeight::W400), "400 is not bold");
    std::printf("  Test 5 (equality, empty patch, weights): PASS\n");
  }

  std::printf("C1.1 element_model: ALL PASS\n");
  return 0;
}
