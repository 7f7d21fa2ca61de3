#pragma once
#include "cf/canvas/Element.hpp"

#include <string>

#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace cf {

// C1.2: JSON codec for elements and element patches.
//
// Element layout (keys in this order):
//   {"id","type":"asset"|"text",
//    asset: "assetId"
//    text:  "text","fontSize","fontFamily","fontWeight","fontStyle",
//           "color","backgroundColor"(only when set),"textAlign"
//    "x","y","width","height","rotation","zIndex","opacity","locked"}
// Finite values survive write -> read -> write byte for byte (full-precision
// parsing); non-finite numbers are written as null.

using JsonWriter = rapidjson::Writer<rapidjson::StringBuffer>;

void writeElementJson(JsonWriter& w, const Element& el);
void writeElementsJson(JsonWriter& w, const ElementList& elements);
void writePatchJson(JsonWriter& w, const ElementPatch& patch);

// Readers return false on a malformed value and leave `out` untouched.
bool readElementJson(const rapidjson::Value& v, Element& out);
bool readElementsJson(const rapidjson::Value& arr, ElementList& out);
bool readPatchJson(const rapidjson::Value& v, ElementPatch& out);

// Whole-document helpers: {"elements":[...]}
std::string elementsToJSON(const ElementList& elements);
bool loadElementsJSON(const std::string& json, ElementList& out);

const char* fontWeightName(FontWeight w);
const char* fontStyleName(FontStyle s);
const char* textAlignName(TextAlign a);
bool parseFontWeight(const std::string& s, FontWeight& out);
bool parseFontStyle(const std::string& s, FontStyle& out);
bool parseTextAlign(const std::string& s, TextAlign& out);

} // namespace cf
