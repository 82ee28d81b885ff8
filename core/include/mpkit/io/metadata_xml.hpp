#pragma once

#include "../metadata_record.hpp"
#include <string>

namespace mpkit {
namespace io {

/**
 * @brief Writes a MetadataRecord as XML.
 *
 * Layout:
 * @code
 * <mpMetadata sourceFile="event.mp" schemaVersion="v3-devices">
 *   <field name="framerate" kind="real" unit="Hz" origin="measured"
 *          source="movie/configuration/Devices/AcqCam/FrameRate">1000</field>
 *   <extra path="movie@version" source="attribute" class="string" elementSize="0" shape="">
 *     <item>1.2</item>
 *   </extra>
 *   <dataset path="movie/frame" class="unsigned" elementSize="2" shape="100 128 128"
 *            layout="chunked"/>
 * </mpMetadata>
 * @endcode
 *
 * Numeric extras are written as space separated values, strings as one
 * item element each and byte blobs base64 encoded.
 */
class MetadataXmlWriter {
public:
    /**
     * @brief Serialize a record to an XML string.
     *
     * @param record Record to write
     * @return XML document
     */
    static std::string toString(const MetadataRecord& record);

    /**
     * @brief Write a record to a file.
     *
     * @param record Record to write
     * @param filename Destination path
     * @throws NotFoundError if the file cannot be written
     */
    static void write(const MetadataRecord& record, const std::string& filename);
};

} // namespace io
} // namespace mpkit
