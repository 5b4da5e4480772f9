#pragma once

#include "Virtualization/descriptor/XmlText.hpp"
#include <pugixml.hpp>
#include <string>

/**
 * @brief Base class of every libvirt descriptor and device builder.
 *
 * Setters only record values; the pugixml document is produced from them
 * on each build(), so a builder may be changed and built again.
 */
class IXmlBuilderBase {
protected:
    pugi::xml_document doc;

    // Appends the descriptor to the empty document.
    virtual void buildDocument() = 0;

public:
    IXmlBuilderBase() = default;

    IXmlBuilderBase(const IXmlBuilderBase&) = delete;
    IXmlBuilderBase& operator=(const IXmlBuilderBase&) = delete;

    IXmlBuilderBase(IXmlBuilderBase&&) noexcept = default;
    IXmlBuilderBase& operator=(IXmlBuilderBase&&) noexcept = default;

    /**
     * @brief Rebuilds the document from the current builder state.
     * @return indented XML without declaration, ready for a libvirt define/attach call
     */
    [[nodiscard]] std::string build() {
        doc.reset();
        buildDocument();
        return toXmlString(doc);
    }

    virtual ~IXmlBuilderBase() = default;
};
