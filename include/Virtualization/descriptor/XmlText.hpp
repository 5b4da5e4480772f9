#pragma once
#include <pugixml.hpp>
#include <string>

// Serialises a pugixml node or document without an XML declaration.
[[nodiscard]] std::string toXmlString(const pugi::xml_node& node);

[[nodiscard]] std::string generateUuid();

// Loads @p xml into @p doc; returns an empty string on success, otherwise the parser's description.
[[nodiscard]] std::string loadXml(pugi::xml_document& doc, const std::string& xml);
