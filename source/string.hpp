#pragma once


#include "memory/buffer.hpp"
#include "number/numeric.hpp"
#include <utility>


// Minimal string helpers. The core links no part of libc's string handling, log
// messages and configuration values are assembled in fixed capacity buffers.


inline u32 str_len(const char* str)
{
    const char* s;

    for (s = str; *s; ++s)
        ;
    return (s - str);
}


inline void str_reverse(char str[], int length)
{
    int start = 0;
    int end = length - 1;

    while (start < end) {
        std::swap(*(str + start), *(str + end));
        start++;
        end--;
    }
}


inline int str_cmp(const char* p1, const char* p2)
{
    const unsigned char* s1 = (const unsigned char*)p1;
    const unsigned char* s2 = (const unsigned char*)p2;

    unsigned char c1, c2;

    do {
        c1 = (unsigned char)*s1++;
        c2 = (unsigned char)*s2++;

        if (c1 == '\0') {
            return c1 - c2;
        }

    } while (c1 == c2);

    return c1 - c2;
}


template <u32 Capacity> class StringBuffer {
public:
    using Buffer = ::Buffer<char, Capacity + 1>;

    StringBuffer(const char* init)
    {
        mem_.push_back('\0');
        (*this) += init;
    }

    StringBuffer()
    {
        mem_.push_back('\0');
    }

    StringBuffer(const StringBuffer& other)
    {
        mem_.push_back('\0');
        (*this) += other.c_str();
    }

    template <u32 OtherCapacity>
    StringBuffer(const StringBuffer<OtherCapacity>& other)
    {
        static_assert(OtherCapacity <= Capacity);

        mem_.push_back('\0');
        (*this) += other.c_str();
    }

    const StringBuffer& operator=(const StringBuffer& other)
    {
        clear();
        (*this) += other.c_str();
        return *this;
    }

    template <u32 OtherCapacity>
    const StringBuffer& operator=(const StringBuffer<OtherCapacity>& other)
    {
        clear();
        (*this) += other.c_str();
        return *this;
    }

    char& operator[](int pos)
    {
        return mem_[pos];
    }

    void push_back(char c)
    {
        if (not mem_.full()) {
            mem_[mem_.size() - 1] = c;
            mem_.push_back('\0');
        }
    }

    void pop_back()
    {
        mem_.pop_back();
        mem_.pop_back();
        mem_.push_back('\0');
    }

    typename Buffer::Iterator begin() const
    {
        return mem_.begin();
    }

    typename Buffer::Iterator end() const
    {
        return mem_.end() - 1;
    }

    StringBuffer& operator+=(const char* str)
    {
        while (*str not_eq '\0') {
            push_back(*(str++));
        }
        return *this;
    }

    template <u32 OtherCapacity>
    StringBuffer& operator+=(const StringBuffer<OtherCapacity>& other)
    {
        (*this) += other.c_str();
        return *this;
    }

    StringBuffer& operator=(const char* str)
    {
        this->clear();

        *this += str;

        return *this;
    }

    bool operator==(const char* str) const
    {
        return str_cmp(str, this->c_str()) == 0;
    }

    bool full() const
    {
        return mem_.full();
    }

    u32 length() const
    {
        return mem_.size() - 1;
    }

    bool empty() const
    {
        return mem_.size() == 1;
    }

    void clear()
    {
        mem_.clear();
        mem_.push_back('\0');
    }

    const char* c_str() const
    {
        return mem_.data();
    }

private:
    Buffer mem_;
};


// Writes the digits of num into buffer. In base ten the buffer needs room for
// twelve characters, in base two for thirty-three.
void to_string(int num, char* buffer, int base);


template <u32 length> StringBuffer<length> to_string(int num)
{
    char temp[12];
    to_string(num, temp, 10);

    return temp;
}
