#pragma once

#include "memory/buffer.hpp"
#include <optional>


// First fit allocator over a line of capacity units, keyed by an identity.
// The line is described as an ordered list of blocks, each either claimed by
// an id or a gap, covering [0, end()). Everything past end() is free.
template <typename Id, u32 max_blocks> class SpriteBlocks {
public:
    explicit SpriteBlocks(u16 capacity) : capacity_(capacity)
    {
    }

    std::optional<u16> find(const Id& id) const
    {
        for (auto& block : blocks_) {
            if (block.id_ and *block.id_ == id) {
                return block.offset_;
            }
        }
        return {};
    }

    // Offset of the block claimed by id. An id that is already present keeps
    // its existing block, whatever the requested size. Otherwise the first gap
    // large enough is claimed, splitting off the remainder, or failing that a
    // new block is appended. Nullopt when neither fits.
    std::optional<u16> insert_sized(const Id& id, u16 size)
    {
        if (auto existing = find(id)) {
            return existing;
        }

        for (auto it = blocks_.begin(); it not_eq blocks_.end(); ++it) {
            if (it->id_ or it->size_ < size) {
                continue;
            }

            if (it->size_ == size) {
                it->id_ = id;
                return it->offset_;
            }

            if (blocks_.full()) {
                return {};
            }

            const u16 offset = it->offset_;
            it->offset_ += size;
            it->size_ -= size;
            blocks_.insert(it, Block{id, offset, size});
            return offset;
        }

        if (blocks_.full() or end() + size > capacity_) {
            return {};
        }

        const u16 offset = end();
        blocks_.push_back(Block{id, offset, size});
        return offset;
    }

    // Turns the id's block into a gap, merged with neighbouring gaps. A
    // trailing gap is dropped, returning its space to the free tail.
    bool remove(const Id& id)
    {
        auto it = blocks_.begin();
        for (; it not_eq blocks_.end(); ++it) {
            if (it->id_ and *it->id_ == id) {
                break;
            }
        }

        if (it == blocks_.end()) {
            return false;
        }

        it->id_.reset();

        cleanup();

        return true;
    }

    // Hands the block of old_id to new_id. Both must describe the same number
    // of units, and new_id must not already be present.
    std::optional<u16> replace_id(const Id& old_id, const Id& new_id, u16 size)
    {
        if (find(new_id)) {
            return {};
        }

        for (auto& block : blocks_) {
            if (block.id_ and *block.id_ == old_id) {
                if (block.size_ not_eq size) {
                    return {};
                }
                block.id_ = new_id;
                return block.offset_;
            }
        }

        return {};
    }

    u16 end() const
    {
        if (blocks_.empty()) {
            return 0;
        }
        return blocks_.back().offset_ + blocks_.back().size_;
    }

    u16 capacity() const
    {
        return capacity_;
    }

    u32 block_count() const
    {
        return blocks_.size();
    }

    void clear()
    {
        blocks_.clear();
    }

private:
    struct Block {
        std::optional<Id> id_;
        u16 offset_;
        u16 size_;
    };

    void cleanup()
    {
        for (auto it = blocks_.begin(); it not_eq blocks_.end();) {
            auto next = it + 1;
            if (not it->id_ and next not_eq blocks_.end() and not next->id_) {
                it->size_ += next->size_;
                blocks_.erase(next);
            } else {
                it = next;
            }
        }

        while (not blocks_.empty() and not blocks_.back().id_) {
            blocks_.pop_back();
        }
    }

    Buffer<Block, max_blocks> blocks_;
    u16 capacity_;
};
