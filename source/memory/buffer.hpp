#pragma once

#include "number/numeric.hpp"
#include <array>
#include <iterator>
#include <new>
#include <type_traits>
#include <utility>


// Fixed capacity vector. Storage lives inline, nothing is ever allocated from
// the heap.
template <typename T, u32 Capacity> class Buffer {
public:
    using Iterator = T*;
    using ValueType = T;

    // (only for stl compatibility)
    using iterator = Iterator;
    using value_type = ValueType;


    Buffer() : mem_{}, begin_((Iterator)mem_.data()), end_(begin_)
    {
    }

    Buffer(const Buffer& other)
        : mem_{}, begin_((Iterator)mem_.data()), end_(begin_)
    {
        for (auto& elem : other) {
            push_back(elem);
        }
    }

    const Buffer& operator=(const Buffer& other)
    {
        clear();
        for (auto& elem : other) {
            push_back(elem);
        }
        return *this;
    }

    Buffer(Buffer&& other) : mem_{}, begin_((Iterator)mem_.data()), end_(begin_)
    {
        for (auto& elem : other) {
            this->push_back(std::move(elem));
        }
        other.clear();
    }

    const Buffer& operator=(Buffer&& other)
    {
        clear();
        for (auto& elem : other) {
            this->push_back(std::move(elem));
        }
        other.clear();
        return *this;
    }

    ~Buffer()
    {
        if constexpr (not std::is_trivially_destructible<T>()) {
            Buffer::clear();
        }
    }


    static constexpr u32 capacity()
    {
        return Capacity;
    }


    Iterator begin()
    {
        return begin_;
    }


    Iterator end()
    {
        return end_;
    }


    Iterator begin() const
    {
        return begin_;
    }


    Iterator end() const
    {
        return end_;
    }


    template <typename... Args> bool emplace_back(Args&&... args)
    {
        if (Buffer::size() < Buffer::capacity()) {
            new (end_) T(std::forward<Args>(args)...);
            ++end_;
            return true;
        } else {
            return false;
        }
    }


    bool push_back(const T& elem)
    {
        if (Buffer::size() < Buffer::capacity()) {
            new (end_) T(elem);
            ++end_;
            return true;
        } else {
            return false;
        }
    }


    bool push_back(T&& elem)
    {
        if (Buffer::size() < Buffer::capacity()) {
            new (end_) T(std::forward<T>(elem));
            ++end_;
            return true;
        } else {
            return false;
        }
    }


    T& operator[](u32 index)
    {
        return begin_[index];
    }


    const T& operator[](u32 index) const
    {
        return begin_[index];
    }


    // Inserts before pos. Returns end() when the buffer is already full.
    Iterator insert(Iterator pos, const T& elem)
    {
        if (full()) {
            return end_;
        } else if (pos == end_) {
            push_back(elem);
            return end_ - 1;
        }

        new (end_) T(std::move(*(end_ - 1)));
        for (auto it = end_ - 1; it not_eq pos; --it) {
            *it = std::move(*(it - 1));
        }
        ++end_;

        *pos = elem;
        return pos;
    }


    Iterator erase(Iterator slot)
    {
        const auto before = slot;

        for (; slot + 1 not_eq end_; ++slot) {
            *slot = std::move(*(slot + 1));
        }
        slot->~T();
        end_ -= 1;
        return before;
    }


    T& back()
    {
        return *(end_ - 1);
    }


    const T& back() const
    {
        return *(end_ - 1);
    }


    T& front()
    {
        return *begin_;
    }


    const T& front() const
    {
        return *begin_;
    }


    void pop_back()
    {
        --end_;
        end_->~T();
    }


    void clear()
    {
        if constexpr (std::is_trivially_destructible<T>()) {
            end_ = begin_;
        } else {
            while (not Buffer::empty())
                Buffer::pop_back();
        }
    }


    u32 size() const
    {
        return end_ - begin_;
    }


    const T* data() const
    {
        return reinterpret_cast<const T*>(mem_.data());
    }


    bool empty() const
    {
        return begin() == end();
    }


    bool full() const
    {
        return Buffer::size() == Buffer::capacity();
    }


private:
    alignas(T) std::array<u8, Capacity * sizeof(T)> mem_;
    Iterator begin_;
    Iterator end_;
};
