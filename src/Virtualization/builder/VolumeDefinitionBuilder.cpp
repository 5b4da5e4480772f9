#include "Virtualization/builder/VolumeDefinitionBuilder.hpp"
#include "Virtualization/Utils/VmException.hpp"
#include <libxml/xmlwriter.h>
#include <memory>

namespace {

struct BufferDeleter {
    void operator()(xmlBufferPtr buffer) const noexcept { xmlBufferFree(buffer); }
};

struct WriterDeleter {
    void operator()(xmlTextWriterPtr writer) const noexcept { xmlFreeTextWriter(writer); }
};

const xmlChar* X(const char* s) { return reinterpret_cast<const xmlChar*>(s); }

} // namespace

void VolumeDefinitionBuilder::check(int rc, const char* step) {
    if (rc < 0) throw VmException(std::string("Failed to write volume descriptor: ") + step);
}

bool VolumeDefinitionBuilder::isSupportedFormat(std::string_view format) noexcept {
    return format == "raw" || format == "qcow2" || format == "vmdk" || format == "iso";
}

std::string VolumeDefinitionBuilder::build() const {
    if (name.empty()) throw InvalidInputException("Volume name is required");
    if (!isSupportedFormat(format)) throw InvalidInputException("Unsupported volume format: " + format);

    std::unique_ptr<xmlBuffer, BufferDeleter> buffer(xmlBufferCreate());
    if (!buffer) throw VmException("Failed to allocate volume descriptor buffer");

    {
        // the writer flushes into the buffer when freed
        std::unique_ptr<xmlTextWriter, WriterDeleter> writer(xmlNewTextWriterMemory(buffer.get(), 0));
        if (!writer) throw VmException("Failed to create volume descriptor writer");
        xmlTextWriterSetIndent(writer.get(), 1);

        const std::string capacityText = std::to_string(capacity);
        const std::string allocationText = std::to_string(allocation);

        check(xmlTextWriterStartElement(writer.get(), X("volume")), "volume");
        check(xmlTextWriterWriteElement(writer.get(), X("name"), X(name.c_str())), "name");

        check(xmlTextWriterStartElement(writer.get(), X("allocation")), "allocation");
        check(xmlTextWriterWriteAttribute(writer.get(), X("unit"), X("bytes")), "allocation unit");
        check(xmlTextWriterWriteString(writer.get(), X(allocationText.c_str())), "allocation value");
        check(xmlTextWriterEndElement(writer.get()), "allocation end");

        check(xmlTextWriterStartElement(writer.get(), X("capacity")), "capacity");
        check(xmlTextWriterWriteAttribute(writer.get(), X("unit"), X("bytes")), "capacity unit");
        check(xmlTextWriterWriteString(writer.get(), X(capacityText.c_str())), "capacity value");
        check(xmlTextWriterEndElement(writer.get()), "capacity end");

        check(xmlTextWriterStartElement(writer.get(), X("target")), "target");
        check(xmlTextWriterStartElement(writer.get(), X("format")), "format");
        check(xmlTextWriterWriteAttribute(writer.get(), X("type"), X(format.c_str())), "format type");
        check(xmlTextWriterEndElement(writer.get()), "format end");
        check(xmlTextWriterStartElement(writer.get(), X("permissions")), "permissions");
        check(xmlTextWriterWriteElement(writer.get(), X("mode"), X(mode.c_str())), "mode");
        check(xmlTextWriterEndElement(writer.get()), "permissions end");
        check(xmlTextWriterEndElement(writer.get()), "target end");

        check(xmlTextWriterEndElement(writer.get()), "volume end");
        check(xmlTextWriterFlush(writer.get()), "flush");
    }

    return std::string(reinterpret_cast<const char*>(xmlBufferContent(buffer.get())),
                       static_cast<std::size_t>(xmlBufferLength(buffer.get())));
}

VolumeDefinitionBuilder& VolumeDefinitionBuilder::setName(std::string_view value) {
    this->name = value;
    return *this;
}

VolumeDefinitionBuilder& VolumeDefinitionBuilder::setFormat(std::string_view value) {
    this->format = value;
    return *this;
}

VolumeDefinitionBuilder& VolumeDefinitionBuilder::setCapacity(std::uint64_t bytes) {
    this->capacity = bytes;
    return *this;
}

VolumeDefinitionBuilder& VolumeDefinitionBuilder::setAllocation(std::uint64_t bytes) {
    this->allocation = bytes;
    return *this;
}

VolumeDefinitionBuilder& VolumeDefinitionBuilder::setMode(std::string_view value) {
    this->mode = value;
    return *this;
}
