// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#include "sentence_dedup/io/DictionarySnapshotIO.hpp"

#include <chrono>
#include <filesystem>
#include <iostream>
#include <sstream>

namespace sentence_dedup::io {

bool DictionarySnapshotIO::write(const std::string& filename, const DictionarySnapshot& snapshot) {
    auto t0 = std::chrono::high_resolution_clock::now();

    std::filesystem::path filepath(filename);
    if (filepath.has_parent_path() && !std::filesystem::exists(filepath.parent_path())) {
        last_error_ = "Directory does not exist: " + filepath.parent_path().string();
        return false;
    }

    hid_t file_id = H5Fcreate(filename.c_str(), H5F_ACC_TRUNC, H5P_DEFAULT, H5P_DEFAULT);
    if (file_id < 0) {
        last_error_ = "Failed to create HDF5 file: " + filename;
        return false;
    }

    bool success = true;
    success = success && writeMetadata(file_id, snapshot);
    success = success && writeEntries(file_id, snapshot);
    success = success && writeJournalState(file_id, snapshot);

    if (H5Fclose(file_id) < 0 && success) {
        last_error_ = "Failed to close HDF5 file: " + filename;
        success = false;
    }

    if (!success) {
        std::error_code ec;
        std::filesystem::remove(filename, ec);
    }

    if (verbose_) {
        auto t1 = std::chrono::high_resolution_clock::now();
        double ms = std::chrono::duration_cast<std::chrono::microseconds>(t1 - t0).count() / 1000.0;
        std::cout << "[PROFILE][DictionarySnapshotIO] write file='" << filename
                  << "' entries=" << snapshot.entries.size() << " time=" << ms << " ms" << std::endl;
    }
    return success;
}

bool DictionarySnapshotIO::read(const std::string& filename, DictionarySnapshot& snapshot) {
    auto t0 = std::chrono::high_resolution_clock::now();

    if (!std::filesystem::exists(filename)) {
        last_error_ = "File does not exist: " + filename;
        return false;
    }
    if (!isValidHDF5(filename)) {
        last_error_ = "Not an HDF5 file: " + filename;
        return false;
    }

    hid_t file_id = H5Fopen(filename.c_str(), H5F_ACC_RDONLY, H5P_DEFAULT);
    if (file_id < 0) {
        last_error_ = "Failed to open HDF5 file: " + filename;
        return false;
    }

    bool success = true;
    success = success && readMetadata(file_id, snapshot);
    success = success && readEntries(file_id, snapshot);
    success = success && readJournalState(file_id, snapshot);

    H5Fclose(file_id);

    if (verbose_) {
        auto t1 = std::chrono::high_resolution_clock::now();
        double ms = std::chrono::duration_cast<std::chrono::microseconds>(t1 - t0).count() / 1000.0;
        std::cout << "[PROFILE][DictionarySnapshotIO] read file='" << filename
                  << "' entries=" << snapshot.entries.size() << " time=" << ms << " ms" << std::endl;
    }
    return success;
}

bool DictionarySnapshotIO::isValidHDF5(const std::string& filename) const {
    if (!std::filesystem::exists(filename)) {
        return false;
    }

    htri_t is_hdf5 = H5Fis_hdf5(filename.c_str());
    return is_hdf5 > 0;
}

bool DictionarySnapshotIO::createGroup(hid_t file_id, const std::string& group_name) {
    hid_t group_id = H5Gcreate2(file_id, group_name.c_str(),
                                H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT);
    if (group_id < 0) {
        last_error_ = "Failed to create group: " + group_name;
        return false;
    }
    H5Gclose(group_id);
    return true;
}

bool DictionarySnapshotIO::writeStringAttribute(hid_t loc_id, const std::string& name, const std::string& value) {
    hid_t datatype = H5Tcopy(H5T_C_S1);
    H5Tset_size(datatype, value.size() + 1);
    H5Tset_strpad(datatype, H5T_STR_NULLTERM);

    hid_t dataspace = H5Screate(H5S_SCALAR);
    hid_t attribute = H5Acreate2(loc_id, name.c_str(), datatype, dataspace,
                                 H5P_DEFAULT, H5P_DEFAULT);

    if (attribute < 0) {
        H5Sclose(dataspace);
        H5Tclose(datatype);
        last_error_ = "Failed to create attribute: " + name;
        return false;
    }

    herr_t status = H5Awrite(attribute, datatype, value.c_str());

    H5Aclose(attribute);
    H5Sclose(dataspace);
    H5Tclose(datatype);

    if (status < 0) {
        last_error_ = "Failed to write attribute: " + name;
    }
    return status >= 0;
}

bool DictionarySnapshotIO::readStringAttribute(hid_t loc_id, const std::string& name, std::string& value) {
    if (H5Aexists(loc_id, name.c_str()) <= 0) {
        last_error_ = "Attribute not found: " + name;
        return false;
    }

    hid_t attribute = H5Aopen(loc_id, name.c_str(), H5P_DEFAULT);
    if (attribute < 0) {
        last_error_ = "Failed to open attribute: " + name;
        return false;
    }

    hid_t datatype = H5Aget_type(attribute);
    size_t size = H5Tget_size(datatype);

    value.resize(size);
    herr_t status = H5Aread(attribute, datatype, &value[0]);

    size_t null_pos = value.find('\0');
    if (null_pos != std::string::npos) {
        value.resize(null_pos);
    }

    H5Tclose(datatype);
    H5Aclose(attribute);

    if (status < 0) {
        last_error_ = "Failed to read attribute: " + name;
    }
    return status >= 0;
}

bool DictionarySnapshotIO::writeU64Attribute(hid_t loc_id, const std::string& name, uint64_t value) {
    hid_t dataspace = H5Screate(H5S_SCALAR);
    hid_t attribute = H5Acreate2(loc_id, name.c_str(), H5T_NATIVE_UINT64, dataspace,
                                 H5P_DEFAULT, H5P_DEFAULT);
    if (attribute < 0) {
        H5Sclose(dataspace);
        last_error_ = "Failed to create attribute: " + name;
        return false;
    }

    herr_t status = H5Awrite(attribute, H5T_NATIVE_UINT64, &value);
    H5Aclose(attribute);
    H5Sclose(dataspace);

    if (status < 0) {
        last_error_ = "Failed to write attribute: " + name;
    }
    return status >= 0;
}

bool DictionarySnapshotIO::readU64Attribute(hid_t loc_id, const std::string& name, uint64_t& value) {
    if (H5Aexists(loc_id, name.c_str()) <= 0) {
        last_error_ = "Attribute not found: " + name;
        return false;
    }

    hid_t attribute = H5Aopen(loc_id, name.c_str(), H5P_DEFAULT);
    if (attribute < 0) {
        last_error_ = "Failed to open attribute: " + name;
        return false;
    }

    herr_t status = H5Aread(attribute, H5T_NATIVE_UINT64, &value);
    H5Aclose(attribute);

    if (status < 0) {
        last_error_ = "Failed to read attribute: " + name;
    }
    return status >= 0;
}

bool DictionarySnapshotIO::writeDataset(hid_t group_id,
                                        const std::string& name,
                                        hid_t type,
                                        hsize_t count,
                                        const void* data) {
    hid_t dataspace = H5Screate_simple(1, &count, nullptr);
    if (dataspace < 0) {
        last_error_ = "Failed to create dataspace for " + name;
        return false;
    }

    hid_t dataset = H5Dcreate2(group_id, name.c_str(), type, dataspace,
                               H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT);
    if (dataset < 0) {
        H5Sclose(dataspace);
        last_error_ = "Failed to create dataset: " + name;
        return false;
    }

    herr_t status = 0;
    if (count > 0) {
        status = H5Dwrite(dataset, type, H5S_ALL, H5S_ALL, H5P_DEFAULT, data);
    }
    H5Dclose(dataset);
    H5Sclose(dataspace);

    if (status < 0) {
        last_error_ = "Failed to write dataset: " + name;
        return false;
    }
    return true;
}

bool DictionarySnapshotIO::readU64Dataset(hid_t group_id, const std::string& name, std::vector<uint64_t>& values) {
    if (H5Lexists(group_id, name.c_str(), H5P_DEFAULT) <= 0) {
        last_error_ = "Dataset not found: " + name;
        return false;
    }

    hid_t dataset = H5Dopen2(group_id, name.c_str(), H5P_DEFAULT);
    if (dataset < 0) {
        last_error_ = "Failed to open dataset: " + name;
        return false;
    }
    hid_t dataspace = H5Dget_space(dataset);

    hsize_t dims[1] = {0};
    if (H5Sget_simple_extent_ndims(dataspace) != 1) {
        H5Sclose(dataspace);
        H5Dclose(dataset);
        last_error_ = "Dataset is not one-dimensional: " + name;
        return false;
    }
    H5Sget_simple_extent_dims(dataspace, dims, nullptr);

    values.resize(dims[0]);
    herr_t status = 0;
    if (dims[0] > 0) {
        status = H5Dread(dataset, H5T_NATIVE_UINT64, H5S_ALL, H5S_ALL, H5P_DEFAULT, values.data());
    }

    H5Sclose(dataspace);
    H5Dclose(dataset);

    if (status < 0) {
        last_error_ = "Failed to read dataset: " + name;
        return false;
    }
    return true;
}

bool DictionarySnapshotIO::readU8Dataset(hid_t group_id, const std::string& name, std::vector<uint8_t>& values) {
    if (H5Lexists(group_id, name.c_str(), H5P_DEFAULT) <= 0) {
        last_error_ = "Dataset not found: " + name;
        return false;
    }

    hid_t dataset = H5Dopen2(group_id, name.c_str(), H5P_DEFAULT);
    if (dataset < 0) {
        last_error_ = "Failed to open dataset: " + name;
        return false;
    }
    hid_t dataspace = H5Dget_space(dataset);

    hsize_t dims[1] = {0};
    if (H5Sget_simple_extent_ndims(dataspace) != 1) {
        H5Sclose(dataspace);
        H5Dclose(dataset);
        last_error_ = "Dataset is not one-dimensional: " + name;
        return false;
    }
    H5Sget_simple_extent_dims(dataspace, dims, nullptr);

    values.resize(dims[0]);
    herr_t status = 0;
    if (dims[0] > 0) {
        status = H5Dread(dataset, H5T_NATIVE_UINT8, H5S_ALL, H5S_ALL, H5P_DEFAULT, values.data());
    }

    H5Sclose(dataspace);
    H5Dclose(dataset);

    if (status < 0) {
        last_error_ = "Failed to read dataset: " + name;
        return false;
    }
    return true;
}

bool DictionarySnapshotIO::writeMetadata(hid_t file_id, const DictionarySnapshot& snapshot) {
    if (!createGroup(file_id, "/metadata")) {
        return false;
    }

    hid_t group_id = H5Gopen2(file_id, "/metadata", H5P_DEFAULT);
    if (group_id < 0) {
        last_error_ = "Failed to open /metadata group";
        return false;
    }

    bool success = true;
    success = success && writeStringAttribute(group_id, "format_version", snapshot.format_version);
    success = success && writeStringAttribute(group_id, "creation_time", snapshot.creation_time);
    success = success && writeStringAttribute(group_id, "hash_algorithm", snapshot.hash_algorithm);
    success = success && writeStringAttribute(group_id, "boundary_rule", snapshot.boundary_rule);
    success = success && writeStringAttribute(group_id, "encode_mode", snapshot.encode_mode);

    H5Gclose(group_id);
    return success;
}

bool DictionarySnapshotIO::readMetadata(hid_t file_id, DictionarySnapshot& snapshot) {
    if (H5Lexists(file_id, "/metadata", H5P_DEFAULT) <= 0) {
        last_error_ = "Metadata group not found";
        return false;
    }

    hid_t group_id = H5Gopen2(file_id, "/metadata", H5P_DEFAULT);
    if (group_id < 0) {
        last_error_ = "Failed to open /metadata group";
        return false;
    }

    bool success = true;
    success = success && readStringAttribute(group_id, "format_version", snapshot.format_version);
    success = success && readStringAttribute(group_id, "hash_algorithm", snapshot.hash_algorithm);
    success = success && readStringAttribute(group_id, "boundary_rule", snapshot.boundary_rule);
    // Informational only.
    if (!readStringAttribute(group_id, "creation_time", snapshot.creation_time)) {
        snapshot.creation_time.clear();
    }
    if (!readStringAttribute(group_id, "encode_mode", snapshot.encode_mode)) {
        snapshot.encode_mode.clear();
    }

    H5Gclose(group_id);

    if (success && snapshot.format_version != "1") {
        last_error_ = "Unsupported snapshot format version: " + snapshot.format_version;
        return false;
    }
    return success;
}

bool DictionarySnapshotIO::writeEntries(hid_t file_id, const DictionarySnapshot& snapshot) {
    const size_t count = snapshot.entries.size();

    std::vector<uint64_t> ids;
    std::vector<uint64_t> occurrence_counts;
    std::vector<uint64_t> offsets;
    std::vector<uint64_t> lengths;
    std::vector<uint8_t> hashes;
    std::vector<uint8_t> blob;
    ids.reserve(count);
    occurrence_counts.reserve(count);
    offsets.reserve(count);
    lengths.reserve(count);
    hashes.reserve(count * snapshot.digest_size);

    for (const auto& sentence : snapshot.entries) {
        if (sentence.content_hash.size() != snapshot.digest_size) {
            std::ostringstream oss;
            oss << "entry " << sentence.id << " hash has " << sentence.content_hash.size()
                << " bytes, expected " << snapshot.digest_size;
            last_error_ = oss.str();
            return false;
        }
        ids.push_back(sentence.id);
        occurrence_counts.push_back(sentence.occurrence_count);
        offsets.push_back(blob.size());
        lengths.push_back(sentence.raw_bytes.size());
        hashes.insert(hashes.end(), sentence.content_hash.begin(), sentence.content_hash.end());
        blob.insert(blob.end(), sentence.raw_bytes.begin(), sentence.raw_bytes.end());
    }

    if (!createGroup(file_id, "/entries")) {
        return false;
    }
    hid_t group_id = H5Gopen2(file_id, "/entries", H5P_DEFAULT);
    if (group_id < 0) {
        last_error_ = "Failed to open /entries group";
        return false;
    }

    const uint64_t entry_count = count;
    const uint32_t digest_size = snapshot.digest_size;

    bool success = true;
    success = success && writeDataset(group_id, "entry_count", H5T_NATIVE_UINT64, 1, &entry_count);
    success = success && writeDataset(group_id, "digest_size", H5T_NATIVE_UINT32, 1, &digest_size);
    success = success && writeDataset(group_id, "ids", H5T_NATIVE_UINT64, ids.size(), ids.data());
    success = success && writeDataset(group_id, "occurrence_counts", H5T_NATIVE_UINT64,
                                      occurrence_counts.size(), occurrence_counts.data());
    success = success && writeDataset(group_id, "offsets", H5T_NATIVE_UINT64, offsets.size(), offsets.data());
    success = success && writeDataset(group_id, "lengths", H5T_NATIVE_UINT64, lengths.size(), lengths.data());
    success = success && writeDataset(group_id, "hashes", H5T_NATIVE_UINT8, hashes.size(), hashes.data());
    success = success && writeDataset(group_id, "blob", H5T_NATIVE_UINT8, blob.size(), blob.data());

    H5Gclose(group_id);
    return success;
}

bool DictionarySnapshotIO::readEntries(hid_t file_id, DictionarySnapshot& snapshot) {
    if (H5Lexists(file_id, "/entries", H5P_DEFAULT) <= 0) {
        last_error_ = "Entries group not found";
        return false;
    }

    hid_t group_id = H5Gopen2(file_id, "/entries", H5P_DEFAULT);
    if (group_id < 0) {
        last_error_ = "Failed to open /entries group";
        return false;
    }

    std::vector<uint64_t> entry_count;
    std::vector<uint64_t> ids;
    std::vector<uint64_t> occurrence_counts;
    std::vector<uint64_t> offsets;
    std::vector<uint64_t> lengths;
    std::vector<uint8_t> hashes;
    std::vector<uint8_t> blob;
    uint32_t digest_size = 0;

    bool success = readU64Dataset(group_id, "entry_count", entry_count);
    if (success) {
        hid_t dataset = H5Dopen2(group_id, "digest_size", H5P_DEFAULT);
        if (dataset < 0 ||
            H5Dread(dataset, H5T_NATIVE_UINT32, H5S_ALL, H5S_ALL, H5P_DEFAULT, &digest_size) < 0) {
            last_error_ = "Failed to read dataset: digest_size";
            success = false;
        }
        if (dataset >= 0) {
            H5Dclose(dataset);
        }
    }
    success = success && readU64Dataset(group_id, "ids", ids);
    success = success && readU64Dataset(group_id, "occurrence_counts", occurrence_counts);
    success = success && readU64Dataset(group_id, "offsets", offsets);
    success = success && readU64Dataset(group_id, "lengths", lengths);
    success = success && readU8Dataset(group_id, "hashes", hashes);
    success = success && readU8Dataset(group_id, "blob", blob);

    H5Gclose(group_id);
    if (!success) {
        return false;
    }

    if (entry_count.size() != 1) {
        last_error_ = "entry_count must hold exactly one value";
        return false;
    }
    const uint64_t count = entry_count[0];
    if (ids.size() != count || occurrence_counts.size() != count ||
        offsets.size() != count || lengths.size() != count) {
        last_error_ = "entry column lengths do not match entry_count";
        return false;
    }
    if (hashes.size() != count * digest_size) {
        last_error_ = "hashes dataset size does not match entry_count x digest_size";
        return false;
    }

    snapshot.digest_size = digest_size;
    snapshot.entries.clear();
    snapshot.entries.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        if (offsets[i] > blob.size() || lengths[i] > blob.size() - offsets[i]) {
            std::ostringstream oss;
            oss << "entry " << ids[i] << " points outside the blob";
            last_error_ = oss.str();
            return false;
        }

        Sentence sentence;
        sentence.id = ids[i];
        sentence.occurrence_count = occurrence_counts[i];
        sentence.raw_bytes.assign(reinterpret_cast<const char*>(blob.data()) + offsets[i], lengths[i]);
        sentence.content_hash.assign(reinterpret_cast<const char*>(hashes.data()) + i * digest_size,
                                     digest_size);
        snapshot.entries.push_back(std::move(sentence));
    }
    return true;
}

bool DictionarySnapshotIO::writeJournalState(hid_t file_id, const DictionarySnapshot& snapshot) {
    if (!createGroup(file_id, "/journal")) {
        return false;
    }

    hid_t group_id = H5Gopen2(file_id, "/journal", H5P_DEFAULT);
    if (group_id < 0) {
        last_error_ = "Failed to open /journal group";
        return false;
    }

    bool success = writeU64Attribute(group_id, "last_sequence", snapshot.last_sequence);
    H5Gclose(group_id);
    return success;
}

bool DictionarySnapshotIO::readJournalState(hid_t file_id, DictionarySnapshot& snapshot) {
    if (H5Lexists(file_id, "/journal", H5P_DEFAULT) <= 0) {
        last_error_ = "Journal group not found";
        return false;
    }

    hid_t group_id = H5Gopen2(file_id, "/journal", H5P_DEFAULT);
    if (group_id < 0) {
        last_error_ = "Failed to open /journal group";
        return false;
    }

    bool success = readU64Attribute(group_id, "last_sequence", snapshot.last_sequence);
    H5Gclose(group_id);
    return success;
}

}  // namespace sentence_dedup::io
