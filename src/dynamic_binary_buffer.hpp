#pragma once

#include <cstdint>
#include <cstring>
#include <vector>

// Append only buffer for building binary packets with fixed maximum size
// It's very similar to std::stringstream but for binary data only
class dynamic_binary_buffer_t {
    public:
    dynamic_binary_buffer_t() = default;

    // We should set maximum buffer size here. It could be done only once
    bool set_maximum_buffer_size_in_bytes(size_t size) {
        // Already allocated
        if (!byte_storage.empty()) {
            return false;
        }

        byte_storage.resize(size);
        return true;
    }

    bool append_data_as_pointer(const void* ptr, size_t length) {
        // Do bounds check
        if (length > byte_storage.size() - internal_data_shift) {
            errors_occured = true;
            return false;
        }

        memcpy(byte_storage.data() + internal_data_shift, ptr, length);
        internal_data_shift += length;
        return true;
    }

    template <typename src_type> bool append_data_as_object_ptr(const src_type* ptr) {
        return append_data_as_pointer(ptr, sizeof(src_type));
    }

    // Return only used memory region
    size_t get_used_size() const {
        return internal_data_shift;
    }

    // Copy of used memory region
    std::vector<uint8_t> get_used_data() const {
        return std::vector<uint8_t>(byte_storage.begin(), byte_storage.begin() + internal_data_shift);
    }

    // If we have any issues with it
    bool is_failed() const {
        return errors_occured;
    }

    private:
    size_t internal_data_shift = 0;
    std::vector<uint8_t> byte_storage{};
    // If any errors occurred in any time when we used this buffer
    bool errors_occured = false;
};
