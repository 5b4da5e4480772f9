#include "Virtualization/descriptor/XmlText.hpp"
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

namespace {

struct xml_string_writer : pugi::xml_writer {
    std::string result;
    void write(const void* data, size_t size) override {
        result.append(static_cast<const char*>(data), size);
    }
};

} // namespace

std::string toXmlString(const pugi::xml_node& node) {
    xml_string_writer writer;
    node.print(writer, "  ", pugi::format_default | pugi::format_no_declaration);
    return writer.result;
}

std::string generateUuid() {
    namespace uuids = boost::uuids;
    uuids::random_generator gen;
    return uuids::to_string(gen());
}

std::string loadXml(pugi::xml_document& doc, const std::string& xml) {
    const pugi::xml_parse_result result = doc.load_string(xml.c_str());
    if (!result) return std::string("XML parse error at offset ") + std::to_string(result.offset) + ": " + result.description();
    if (!doc.document_element()) return "XML document has no root element";
    return {};
}
