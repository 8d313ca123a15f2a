#pragma once

#include <array>
#include <ciso646>
#include <new>
#include <stdint.h>
#include <type_traits>
#include <utility>


// A fixed-space version of std::function, does not allocate.


template <std::size_t storage, typename T> class Function {
};


template <std::size_t storage, typename R, typename... Args>
class Function<storage, R(Args...)> {
public:
    Function()
        : invoke_policy_(nullptr), construct_policy_(nullptr),
          move_policy_(nullptr), destroy_policy_(nullptr)
    {
    }


    template <typename Functor,
              typename = std::enable_if_t<
                  not std::is_same<std::decay_t<Functor>, Function>::value>>
    Function(Functor f)
        : invoke_policy_(reinterpret_cast<InvokePolicy>(invokeImpl<Functor>)),
          construct_policy_(
              reinterpret_cast<ConstructPolicy>(constructImpl<Functor>)),
          move_policy_(reinterpret_cast<MovePolicy>(moveImpl<Functor>)),
          destroy_policy_(reinterpret_cast<DestroyPolicy>(destroyImpl<Functor>))
    {
        static_assert(storage >= sizeof(Functor));
        static_assert(alignof(Functor) <= 8,
                      "Function uses a hard-coded maximum alignment of"
                      " eight bytes.");
        construct_policy_(internal_storage_.data(), reinterpret_cast<void*>(&f));
    }


    Function(Function const& rhs)
        : invoke_policy_(rhs.invoke_policy_),
          construct_policy_(rhs.construct_policy_),
          move_policy_(rhs.move_policy_), destroy_policy_(rhs.destroy_policy_)
    {
        if (invoke_policy_) {
            construct_policy_(internal_storage_.data(),
                              const_cast<uint8_t*>(rhs.internal_storage_.data()));
        }
    }


    Function(Function&& rhs)
        : invoke_policy_(rhs.invoke_policy_),
          construct_policy_(rhs.construct_policy_),
          move_policy_(rhs.move_policy_), destroy_policy_(rhs.destroy_policy_)
    {
        if (invoke_policy_) {
            move_policy_(internal_storage_.data(), rhs.internal_storage_.data());
            rhs.reset();
        }
    }


    Function& operator=(Function&& rhs)
    {
        if (this not_eq &rhs) {
            reset();
            invoke_policy_ = rhs.invoke_policy_;
            construct_policy_ = rhs.construct_policy_;
            move_policy_ = rhs.move_policy_;
            destroy_policy_ = rhs.destroy_policy_;
            if (invoke_policy_) {
                move_policy_(internal_storage_.data(),
                             rhs.internal_storage_.data());
                rhs.reset();
            }
        }
        return *this;
    }


    Function& operator=(const Function&) = delete;


    ~Function()
    {
        reset();
    }


    explicit operator bool() const
    {
        return invoke_policy_ not_eq nullptr;
    }


    void reset()
    {
        if (invoke_policy_) {
            destroy_policy_(internal_storage_.data());
        }
        invoke_policy_ = nullptr;
        construct_policy_ = nullptr;
        move_policy_ = nullptr;
        destroy_policy_ = nullptr;
    }


    R operator()(Args... args)
    {
        return invoke_policy_(internal_storage_.data(),
                              std::forward<Args>(args)...);
    }


private:
    typedef R (*InvokePolicy)(void*, Args&&...);
    typedef void (*ConstructPolicy)(void*, void*);
    typedef void (*MovePolicy)(void*, void*);
    typedef void (*DestroyPolicy)(void*);


    template <typename Functor> static R invokeImpl(Functor* fn, Args&&... args)
    {
        return (*fn)(std::forward<Args>(args)...);
    }


    template <typename Functor>
    static void constructImpl(Functor* construct_dst, Functor* construct_src)
    {
        new (construct_dst) Functor(*construct_src);
    }


    template <typename Functor>
    static void moveImpl(Functor* move_dst, Functor* move_src)
    {
        new (move_dst) Functor(std::move(*move_src));
    }


    template <typename Functor> static void destroyImpl(Functor* f)
    {
        f->~Functor();
    }


    InvokePolicy invoke_policy_;
    ConstructPolicy construct_policy_;
    MovePolicy move_policy_;
    DestroyPolicy destroy_policy_;
    alignas(8) std::array<uint8_t, storage> internal_storage_;
};
