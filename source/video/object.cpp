#include "object.hpp"
#include "volatile.hpp"


// Each oam entry is eight bytes: three attribute halfwords, and a fourth
// halfword that belongs to the affine parameter table. Attribute writes skip
// the fourth.
using Oam = MemoryAddress<Region::oam, 0x0, ObjectAttributes, 128, 8>;


ObjectHandle::ObjectHandle(ObjectHandle&& other) noexcept
    : owner_(other.owner_), index_(other.index_)
{
    other.owner_ = nullptr;
}


ObjectHandle& ObjectHandle::operator=(ObjectHandle&& other) noexcept
{
    if (this not_eq &other) {
        if (owner_) {
            owner_->release_deferred(index_);
        }
        owner_ = other.owner_;
        index_ = other.index_;
        other.owner_ = nullptr;
    }
    return *this;
}


ObjectHandle::~ObjectHandle()
{
    if (owner_) {
        owner_->release_deferred(index_);
    }
}


std::optional<ObjectHandle> ObjectAllocator::acquire()
{
    const auto slot = occupied_.first_clear();
    if (not slot) {
        return {};
    }

    occupied_.set(*slot, true);

    return ObjectHandle(*this, *slot);
}


void ObjectAllocator::release(ObjectHandle&& handle, const VBlank&)
{
    if (handle.owner_ not_eq this) {
        return;
    }

    const u8 index = handle.index_;
    handle.owner_ = nullptr;

    occupied_.set(index, false);
    pending_hide_.set(index, false);
    hide(index);
}


void ObjectAllocator::release_deferred(u8 index)
{
    occupied_.set(index, false);
    pending_hide_.set(index, true);
}


void ObjectAllocator::hide(u8 index)
{
    shadow_[index].set_hidden(true);

    if (auto cell = Oam::block().index(index)) {
        cell->write(shadow_[index]);
    }
}


void ObjectAllocator::write_attributes(const ObjectHandle& handle,
                                       const ObjectAttributes& attributes,
                                       const VBlank&)
{
    if (handle.owner_ not_eq this) {
        return;
    }

    const u8 index = handle.index_;

    shadow_[index] = attributes;

    // The new owner's entry replaces whatever the previous owner left behind.
    pending_hide_.set(index, false);

    if (auto cell = Oam::block().index(index)) {
        cell->write(attributes);
    }
}


u32 ObjectAllocator::flush(const VBlank&)
{
    if (not pending_hide_.any()) {
        return 0;
    }

    u32 hidden = 0;

    for (u32 i = 0; i < capacity; ++i) {
        if (pending_hide_.get(i)) {
            hide(i);
            ++hidden;
        }
    }

    pending_hide_.clear();

    return hidden;
}


void ObjectAllocator::reset(const VBlank&)
{
    for (u32 i = 0; i < capacity; ++i) {
        hide(i);
    }

    pending_hide_.clear();
}
