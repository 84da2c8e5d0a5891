#include "core/securememory.hpp"
#include <cstring>

namespace ledgerseal::core {

void SecureMemory::wipe(void* ptr, size_t size) {
    if (ptr && size > 0) {
        volatile unsigned char* p = static_cast<unsigned char*>(ptr);
        while (size--) {
            *p++ = 0;
        }
    }
}

template<typename T>
SecureMemory::SecureVector<T>::SecureVector(size_t size)
    : data_(new T[size]), size_(size) {
    std::memset(data_.get(), 0, size * sizeof(T));
}

template<typename T>
SecureMemory::SecureVector<T>::~SecureVector() {
    clear();
}

template<typename T>
SecureMemory::SecureVector<T>::SecureVector(SecureVector&& other) noexcept
    : data_(std::move(other.data_)), size_(other.size_) {
    other.size_ = 0;
}

template<typename T>
SecureMemory::SecureVector<T>& SecureMemory::SecureVector<T>::operator=(SecureVector&& other) noexcept {
    if (this != &other) {
        clear();
        data_ = std::move(other.data_);
        size_ = other.size_;
        other.size_ = 0;
    }
    return *this;
}

template<typename T>
SecureMemory::SecureVector<T> SecureMemory::SecureVector<T>::clone() const {
    if (!data_) {
        return SecureVector();
    }
    return SecureVector(data_.get(), data_.get() + size_);
}

template<typename T>
void SecureMemory::SecureVector<T>::resize(size_t new_size) {
    if (new_size == size_) return;

    auto new_data = std::make_unique<T[]>(new_size);
    if (data_) {
        std::memcpy(new_data.get(), data_.get(),
                   std::min(size_, new_size) * sizeof(T));
        clear();
    }
    data_ = std::move(new_data);
    size_ = new_size;
}

template<typename T>
void SecureMemory::SecureVector<T>::clear() {
    if (data_) {
        SecureMemory::wipe(data_.get(), size_ * sizeof(T));
    }
    data_.reset();
    size_ = 0;
}

// Explicit template instantiation for key bytes
template class SecureMemory::SecureVector<uint8_t>;

} // namespace ledgerseal::core
