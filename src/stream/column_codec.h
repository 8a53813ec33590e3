#pragma once

#include <cstddef>
#include <cstdint>
#include <istream>
#include <ostream>
#include <string>
#include <type_traits>
#include <vector>

/**
 * Binary encoding of operator checkpoints.
 * Every checkpoint starts with a StateHeader followed by the columns of the
 * in-progress output batch in a fixed order.
 */

namespace Estuary {
namespace checkpoint {

static constexpr uint32_t kStateMagic = 0x45535455;  // "ESTU"
static constexpr uint16_t kStateFormatVersion = 1;

struct StateHeader {
    uint32_t magic;
    uint16_t version;
    uint16_t flags;               // Reserved
    int64_t next_left_time;
    int64_t next_right_time;
    int64_t watermark;
    uint64_t output_count;        // Rows of the in-progress output batch
    uint64_t output_capacity;     // Capacity of the batch that was checkpointed
};

static_assert(sizeof(StateHeader) == 48, "StateHeader must be exactly 48 bytes");
static_assert(std::is_trivially_copyable<StateHeader>::value, "StateHeader is written as raw bytes");

/**
 * Column encoding; raw bytes for trivially copyable element types
 */
template <typename T>
struct ColumnCodec {
    static_assert(std::is_trivially_copyable<T>::value,
                  "Checkpointed columns need a ColumnCodec specialization for non-trivial types");

    static void Write(std::ostream& os, const std::vector<T>& column, size_t count) {
        os.write(reinterpret_cast<const char*>(column.data()), static_cast<std::streamsize>(count * sizeof(T)));
    }

    static bool Read(std::istream& is, std::vector<T>& column, size_t count) {
        is.read(reinterpret_cast<char*>(column.data()), static_cast<std::streamsize>(count * sizeof(T)));
        return static_cast<bool>(is);
    }
};

/**
 * Length-prefixed strings
 */
template <>
struct ColumnCodec<std::string> {
    static void Write(std::ostream& os, const std::vector<std::string>& column, size_t count) {
        for (size_t i = 0; i < count; ++i) {
            uint64_t len = column[i].size();
            os.write(reinterpret_cast<const char*>(&len), sizeof(len));
            os.write(column[i].data(), static_cast<std::streamsize>(len));
        }
    }

    static bool Read(std::istream& is, std::vector<std::string>& column, size_t count) {
        for (size_t i = 0; i < count; ++i) {
            uint64_t len = 0;
            if (!is.read(reinterpret_cast<char*>(&len), sizeof(len))) return false;
            if (len > kMaxStringBytes) return false;
            column[i].resize(len);
            if (len > 0 && !is.read(&column[i][0], static_cast<std::streamsize>(len))) return false;
        }
        return true;
    }

    static constexpr uint64_t kMaxStringBytes = 1ULL << 30;  // Sanity bound on a corrupt length
};

} // namespace checkpoint
} // namespace Estuary
