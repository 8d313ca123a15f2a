#pragma once

#include <functional>


// A nominal identity token. Two ids compare equal only when they originate
// from the same definition site, regardless of the contents of whatever they
// identify. Ids are the address of a static object that exists once per marker
// type, so they cost nothing at runtime, and need no allocation or
// registration.
class UniqueId {
public:
    template <typename Marker> static UniqueId of()
    {
        return UniqueId(&Anchor<Marker>::tag);
    }

    const void* token() const
    {
        return token_;
    }

    bool operator==(const UniqueId& other) const
    {
        return token_ == other.token_;
    }

    bool operator not_eq(const UniqueId& other) const
    {
        return token_ not_eq other.token_;
    }

    bool operator<(const UniqueId& other) const
    {
        return std::less<const void*>()(token_, other.token_);
    }

private:
    // Not const, so that the linker may not fold anchors together.
    template <typename Marker> struct Anchor {
        static char tag;
    };

    explicit UniqueId(const void* token) : token_(token)
    {
    }

    const void* token_;
};


template <typename Marker> char UniqueId::Anchor<Marker>::tag;


// Each expansion declares its own marker type inside a distinct lambda, and
// therefore produces a distinct id. Evaluating the same expansion repeatedly
// yields the same id.
#define VGATE_UNIQUE_ID()                                                      \
    ([] {                                                                      \
        struct Marker {                                                        \
        };                                                                     \
        return ::UniqueId::of<Marker>();                                       \
    }())
