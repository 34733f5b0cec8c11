// SPDX-FileCopyrightText: 2025 Ryo Funai
// SPDX-License-Identifier: Apache-2.0

#ifndef SENTENCE_DEDUP_IO_DICTIONARY_SNAPSHOT_IO_HPP
#define SENTENCE_DEDUP_IO_DICTIONARY_SNAPSHOT_IO_HPP

#include <cstdint>
#include <string>
#include <vector>

#include <hdf5.h>
#include <hdf5_hl.h>

#include "sentence_dedup/core/DedupTypes.hpp"

namespace sentence_dedup::io {

// Compacted dictionary index.
struct DictionarySnapshot {
    std::string format_version = "1";
    std::string creation_time;
    std::string hash_algorithm;
    std::string boundary_rule;
    std::string encode_mode;  // empty until the first encode pins it
    uint32_t digest_size = 0;
    uint64_t last_sequence = 0;
    std::vector<Sentence> entries;
};

// HDF5 layout:
//   /metadata   attributes format_version, creation_time, hash_algorithm,
//               boundary_rule, encode_mode
//   /entries    entry_count, digest_size, ids, occurrence_counts, offsets,
//               lengths, hashes (entry_count x digest_size), blob
//   /journal    attribute last_sequence
class DictionarySnapshotIO {
public:
    DictionarySnapshotIO() = default;
    ~DictionarySnapshotIO() = default;

    bool write(const std::string& filename, const DictionarySnapshot& snapshot);
    bool read(const std::string& filename, DictionarySnapshot& snapshot);

    bool isValidHDF5(const std::string& filename) const;

    std::string getLastError() const { return last_error_; }

    void setVerbose(bool verbose) { verbose_ = verbose; }

private:
    std::string last_error_;
    bool verbose_ = false;

    bool writeMetadata(hid_t file_id, const DictionarySnapshot& snapshot);
    bool writeEntries(hid_t file_id, const DictionarySnapshot& snapshot);
    bool writeJournalState(hid_t file_id, const DictionarySnapshot& snapshot);

    bool readMetadata(hid_t file_id, DictionarySnapshot& snapshot);
    bool readEntries(hid_t file_id, DictionarySnapshot& snapshot);
    bool readJournalState(hid_t file_id, DictionarySnapshot& snapshot);

    bool createGroup(hid_t file_id, const std::string& group_name);
    bool writeStringAttribute(hid_t loc_id, const std::string& name, const std::string& value);
    bool readStringAttribute(hid_t loc_id, const std::string& name, std::string& value);
    bool writeU64Attribute(hid_t loc_id, const std::string& name, uint64_t value);
    bool readU64Attribute(hid_t loc_id, const std::string& name, uint64_t& value);

    bool writeDataset(hid_t group_id, const std::string& name, hid_t type, hsize_t count, const void* data);
    bool readU64Dataset(hid_t group_id, const std::string& name, std::vector<uint64_t>& values);
    bool readU8Dataset(hid_t group_id, const std::string& name, std::vector<uint8_t>& values);
};

}  // namespace sentence_dedup::io

#endif  // SENTENCE_DEDUP_IO_DICTIONARY_SNAPSHOT_IO_HPP
