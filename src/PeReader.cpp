/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/. */

#include "PeReader.h"
#include <algorithm>
#include <cstring>
#include <map>
#include "BinExceptions.h"
#include "BinMemoryValidator.h"
#include "PeFormat.h"

using BinReaderExceptions::BinaryFileError;
using BinReaderUtils::BinMemoryValidator;
namespace MemoryConstants = BinReaderUtils::MemoryConstants;
using namespace PeFormat;

namespace {

struct DataDirectory {
    uint32_t rva = 0;
    uint32_t size = 0;
};

/// Optional header fields past this offset are not needed
constexpr size_t OPT_SUBSYSTEM_END = OPT_SUBSYSTEM + 2;

/**
 * @brief Read a NUL-terminated string at an RVA, if the RVA maps into the file
 */
std::optional<std::string> stringAtRva(const BinMemoryValidator& image,
                                       const PeModel& model,
                                       uint32_t rva,
                                       const char* context) {
    auto offset = PeReader::rvaToOffset(model, rva);
    if (!offset || !image.inBounds(*offset, 1)) {
        return std::nullopt;
    }
    return image.readString(*offset, MemoryConstants::MAX_STRING_LENGTH, context);
}

void readImports(const BinMemoryValidator& image,
                 PeModel& model,
                 const DataDirectory& directory,
                 const std::string& filename) {
    if (directory.rva == 0) {
        return;
    }
    auto table = PeReader::rvaToOffset(model, directory.rva);
    if (!table) {
        throw BinaryFileError::invalidFormat("import directory RVA", filename);
    }

    const uint64_t thunk_size = model.is_64 ? 8 : 4;
    for (size_t d = 0; d < MemoryConstants::MAX_TABLE_ENTRIES; ++d) {
        uint64_t descriptor = *table + d * IMPORT_DESCRIPTOR_SIZE;
        image.validateRange(descriptor, IMPORT_DESCRIPTOR_SIZE, "import descriptor");
        uint32_t lookup_rva = image.readU32(descriptor);
        uint32_t name_rva = image.readU32(descriptor + 12);
        uint32_t iat_rva = image.readU32(descriptor + 16);
        if (lookup_rva == 0 && name_rva == 0 && iat_rva == 0) {
            break;
        }

        auto dll = stringAtRva(image, model, name_rva, "import DLL name");
        if (!dll) {
            continue;
        }
        if (std::find(model.libraries.begin(), model.libraries.end(), *dll) ==
            model.libraries.end()) {
            model.libraries.push_back(*dll);
        }

        // Bound images overwrite the IAT; prefer the lookup table when present
        auto thunks = PeReader::rvaToOffset(model, lookup_rva != 0 ? lookup_rva : iat_rva);
        if (!thunks) {
            continue;
        }

        for (uint64_t i = 0; i < MemoryConstants::MAX_TABLE_ENTRIES; ++i) {
            uint64_t slot = *thunks + i * thunk_size;
            if (!image.inBounds(slot, thunk_size)) {
                break;
            }
            uint64_t thunk = image.readWord(slot, model.is_64, "import thunk");
            if (thunk == 0) {
                break;
            }

            PeImport imported;
            imported.dll = *dll;
            imported.iat_rva = iat_rva + i * thunk_size;
            bool by_ordinal = model.is_64 ? (thunk & IMAGE_ORDINAL_FLAG64) != 0
                                          : (thunk & IMAGE_ORDINAL_FLAG32) != 0;
            if (by_ordinal) {
                imported.by_ordinal = true;
                imported.ordinal = static_cast<uint16_t>(thunk & 0xffff);
            } else {
                auto hint_name = PeReader::rvaToOffset(model, static_cast<uint32_t>(thunk & 0x7fffffff));
                if (!hint_name || !image.inBounds(*hint_name, 3)) {
                    continue;
                }
                imported.hint = image.readU16(*hint_name, "import hint");
                imported.name = image.readString(*hint_name + 2, MemoryConstants::MAX_STRING_LENGTH,
                                                 "import name");
            }
            model.imports.push_back(std::move(imported));
        }
    }
}

void readExports(const BinMemoryValidator& image,
                 PeModel& model,
                 const DataDirectory& directory,
                 const std::string& filename) {
    if (directory.rva == 0) {
        return;
    }
    auto table = PeReader::rvaToOffset(model, directory.rva);
    if (!table) {
        throw BinaryFileError::invalidFormat("export directory RVA", filename);
    }
    image.validateRange(*table, EXPORT_DIRECTORY_SIZE, "export directory");

    uint32_t name_rva = image.readU32(*table + 12);
    uint32_t ordinal_base = image.readU32(*table + 16);
    uint32_t function_count = image.readU32(*table + 20);
    uint32_t name_count = image.readU32(*table + 24);
    uint32_t functions_rva = image.readU32(*table + 28);
    uint32_t names_rva = image.readU32(*table + 32);
    uint32_t ordinals_rva = image.readU32(*table + 36);

    if (function_count > MemoryConstants::MAX_TABLE_ENTRIES ||
        name_count > MemoryConstants::MAX_TABLE_ENTRIES) {
        throw BinaryFileError::invalidFormat("export directory entry count", filename);
    }

    model.export_name = stringAtRva(image, model, name_rva, "export DLL name");

    // Function index -> exported name
    std::map<uint32_t, std::string> names;
    auto names_offset = PeReader::rvaToOffset(model, names_rva);
    auto ordinals_offset = PeReader::rvaToOffset(model, ordinals_rva);
    if (names_offset && ordinals_offset) {
        for (uint32_t i = 0; i < name_count; ++i) {
            if (!image.inBounds(*names_offset + i * 4ull, 4) ||
                !image.inBounds(*ordinals_offset + i * 2ull, 2)) {
                break;
            }
            uint32_t entry_name_rva = image.readU32(*names_offset + i * 4ull);
            uint16_t function_index = image.readU16(*ordinals_offset + i * 2ull);
            auto name = stringAtRva(image, model, entry_name_rva, "export name");
            if (name) {
                names.emplace(function_index, std::move(*name));
            }
        }
    }

    auto functions_offset = PeReader::rvaToOffset(model, functions_rva);
    if (!functions_offset) {
        return;
    }
    for (uint32_t i = 0; i < function_count; ++i) {
        if (!image.inBounds(*functions_offset + i * 4ull, 4)) {
            break;
        }
        uint32_t rva = image.readU32(*functions_offset + i * 4ull);
        if (rva == 0) {
            continue;
        }

        PeExport exported;
        exported.ordinal = ordinal_base + i;
        exported.rva = rva;
        auto name = names.find(i);
        if (name != names.end()) {
            exported.name = name->second;
        }
        // An RVA inside the export directory names a forwarder string
        if (rva >= directory.rva && rva - directory.rva < directory.size) {
            exported.forwarder = stringAtRva(image, model, rva, "export forwarder");
        }
        model.exports.push_back(std::move(exported));
    }
}

}  // namespace

// ============================================================================
// PeReader Implementation
// ============================================================================

std::optional<uint64_t> PeReader::rvaToOffset(const PeModel& model, uint32_t rva) {
    uint32_t lowest_section = UINT32_MAX;
    for (const auto& section : model.sections) {
        lowest_section = std::min(lowest_section, section.virtual_address);
        uint32_t span = std::max(section.virtual_size, section.raw_size);
        if (rva >= section.virtual_address && rva - section.virtual_address < span) {
            uint32_t displacement = rva - section.virtual_address;
            if (displacement >= section.raw_size) {
                return std::nullopt;  // uninitialized tail
            }
            return static_cast<uint64_t>(section.raw_offset) + displacement;
        }
    }
    // Headers are mapped at their file offsets
    if (rva < lowest_section) {
        return rva;
    }
    return std::nullopt;
}

PeModel PeReader::read(const uint8_t* data, size_t size, const std::string& filename) {
    BinMemoryValidator image(data, size, filename);
    PeModel model;

    if (image.readU16(0, "DOS signature") != IMAGE_DOS_SIGNATURE) {
        throw BinaryFileError::invalidFormat("DOS signature", filename);
    }
    uint32_t nt_offset = image.readU32(DOS_E_LFANEW_OFFSET, "e_lfanew");
    if (image.readU32(nt_offset, "PE signature") != IMAGE_NT_SIGNATURE) {
        throw BinaryFileError::invalidFormat("PE signature", filename);
    }

    // COFF file header
    uint64_t coff = nt_offset + 4ull;
    image.validateRange(coff, FILE_HEADER_SIZE, "COFF header");
    model.machine = image.readU16(coff);
    uint16_t section_count = image.readU16(coff + 2);
    model.timestamp = image.readU32(coff + 4);
    uint16_t optional_size = image.readU16(coff + 16);
    model.characteristics = image.readU16(coff + 18);
    model.is_lib = (model.characteristics & IMAGE_FILE_DLL) != 0;

    // Optional header
    uint64_t optional = coff + FILE_HEADER_SIZE;
    DataDirectory export_directory;
    DataDirectory import_directory;
    if (optional_size != 0) {
        if (optional_size < OPT_SUBSYSTEM_END) {
            throw BinaryFileError::invalidFormat(
                "optional header size " + std::to_string(optional_size), filename);
        }
        image.validateRange(optional, optional_size, "optional header");
        uint16_t magic = image.readU16(optional);
        if (magic != IMAGE_NT_OPTIONAL_HDR32_MAGIC && magic != IMAGE_NT_OPTIONAL_HDR64_MAGIC) {
            throw BinaryFileError::invalidFormat("optional header magic", filename);
        }
        model.is_64 = magic == IMAGE_NT_OPTIONAL_HDR64_MAGIC;
        model.entry_rva = image.readU32(optional + OPT_ADDRESS_OF_ENTRY_POINT);
        model.image_base = model.is_64 ? image.readU64(optional + OPT64_IMAGE_BASE)
                                       : image.readU32(optional + OPT32_IMAGE_BASE);
        model.subsystem = image.readU16(optional + OPT_SUBSYSTEM);

        size_t count_offset = model.is_64 ? OPT64_NUMBER_OF_RVA_AND_SIZES : OPT32_NUMBER_OF_RVA_AND_SIZES;
        size_t directories = model.is_64 ? OPT64_DATA_DIRECTORIES : OPT32_DATA_DIRECTORIES;
        if (count_offset + 4 <= optional_size) {
            uint32_t directory_count = image.readU32(optional + count_offset);
            auto readDirectory = [&](uint32_t index, DataDirectory& directory) {
                size_t entry = directories + index * 8;
                if (index < directory_count && entry + 8 <= optional_size) {
                    directory.rva = image.readU32(optional + entry);
                    directory.size = image.readU32(optional + entry + 4);
                }
            };
            readDirectory(IMAGE_DIRECTORY_ENTRY_EXPORT, export_directory);
            readDirectory(IMAGE_DIRECTORY_ENTRY_IMPORT, import_directory);
        }
    }

    // Section table
    if (section_count > MemoryConstants::MAX_PE_SECTIONS) {
        throw BinaryFileError::invalidFormat("section count " + std::to_string(section_count),
                                             filename);
    }
    uint64_t section_table = optional + optional_size;
    image.validateRange(section_table, section_count * SECTION_HEADER_SIZE, "section table");
    model.sections.reserve(section_count);
    for (uint16_t i = 0; i < section_count; ++i) {
        uint64_t header = section_table + i * SECTION_HEADER_SIZE;
        const char* name = reinterpret_cast<const char*>(image.getData()) + header;
        PeSection section;
        section.name = std::string(name, strnlen(name, SECTION_NAME_SIZE));
        section.virtual_size = image.readU32(header + 8);
        section.virtual_address = image.readU32(header + 12);
        section.raw_size = image.readU32(header + 16);
        section.raw_offset = image.readU32(header + 20);
        section.characteristics = image.readU32(header + 36);
        model.sections.push_back(std::move(section));
    }

    readImports(image, model, import_directory, filename);
    readExports(image, model, export_directory, filename);
    return model;
}
