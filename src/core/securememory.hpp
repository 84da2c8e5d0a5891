#pragma once

#include "core/core_export.hpp"
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <memory>

namespace ledgerseal::core {

/**
 * @brief Wiping storage for key material
 *
 * Signing keys for timestamp tokens and checkpoint exports live in
 * SecureVector buffers that are zeroed before release.
 */
class LEDGERSEAL_CORE_EXPORT SecureMemory {
public:
    /**
     * @brief Securely wipe memory region
     * @param ptr Pointer to memory
     * @param size Size in bytes
     */
    static void wipe(void* ptr, size_t size);

    /**
     * @brief Secure vector class that auto-wipes memory
     */
    template<typename T>
    class SecureVector {
    public:
        SecureVector() : size_(0) {}
        explicit SecureVector(size_t size);

        template<typename InputIt>
        SecureVector(InputIt first, InputIt last)
            : data_(new T[static_cast<size_t>(std::distance(first, last))])
            , size_(static_cast<size_t>(std::distance(first, last))) {
            std::copy(first, last, data_.get());
        }
        ~SecureVector();

        // Move operations
        SecureVector(SecureVector&& other) noexcept;
        SecureVector& operator=(SecureVector&& other) noexcept;

        // Prevent copying
        SecureVector(const SecureVector&) = delete;
        SecureVector& operator=(const SecureVector&) = delete;

        T* data() { return data_.get(); }
        const T* data() const { return data_.get(); }
        size_t size() const { return size_; }
        bool empty() const { return size_ == 0; }

        /**
         * @brief Copy into a new wiping buffer
         */
        SecureVector clone() const;

        void resize(size_t new_size);
        void clear();

    private:
        std::unique_ptr<T[]> data_;
        size_t size_;
    };
};

} // namespace ledgerseal::core
