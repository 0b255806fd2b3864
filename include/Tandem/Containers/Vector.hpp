/// @file Vector.hpp
/// @brief Declaration and inline implementation of the Vector container class.
/// @details
/// A dynamically resizable array that stores elements contiguously in memory obtained from a
/// value-stored allocator. It is the storage of `LinearMap`, so besides the usual
/// append/pop operations it offers the unordered `SwapRemove` and the stable `RetainIf`.
#pragma once

#include <Tandem/Containers/ContainerError.hpp>
#include <Tandem/Memory/AllocatorConcept.hpp>
#include <Tandem/Memory/SystemAllocator.hpp>
#include <Tandem/Primitives.hpp>

#include <cstddef>
#include <initializer_list>
#include <new>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace Tandem::Containers
{
    /// @tparam T Element type
    /// @tparam Alloc Allocator satisfying AllocatorConcept (value-stored). Defaults to SystemAllocator.
    template<class T, Tandem::Memory::AllocatorConcept Alloc = Tandem::Memory::SystemAllocator>
    class Vector
    {
    public:
        using Value     = T;
        using AllocType = Alloc;

        Vector() noexcept = default;
        explicit Vector(UIntSize initialCapacity, Alloc alloc = Alloc {}) : alloc_(std::move(alloc))
        {
            if (initialCapacity)
                Reserve(initialCapacity);
        }
        Vector(std::initializer_list<T> init, Alloc alloc = Alloc {}) : alloc_(std::move(alloc))
        {
            Reserve(init.size());
            for (auto& v: init)
                ::new (&data_[size_++]) T(v);
        }
        Vector(const Vector& other) : alloc_(other.alloc_)
        {
            Reserve(other.size_);
            for (UIntSize i = 0; i < other.size_; ++i)
            {
                ::new (&data_[i]) T(other.data_[i]);
                ++size_;
            }
        }
        Vector& operator=(const Vector& other)
        {
            if (this != &other)
            {
                Vector copy(other);
                *this = std::move(copy);
            }
            return *this;
        }
        Vector(Vector&& other) noexcept
            : alloc_(std::move(other.alloc_)), data_(other.data_), size_(other.size_), capacity_(other.capacity_)
        {
            other.data_ = nullptr;
            other.size_ = other.capacity_ = 0;
        }
        Vector& operator=(Vector&& other) noexcept
        {
            if (this != &other)
            {
                Release_();
                alloc_      = std::move(other.alloc_);
                data_       = other.data_;
                size_       = other.size_;
                capacity_   = other.capacity_;
                other.data_ = nullptr;
                other.size_ = other.capacity_ = 0;
            }
            return *this;
        }
        ~Vector() { Release_(); }

        //=== Element modifiers ===//

        /// @brief Push by copy.
        void PushBack(const T& value)
        {
            EnsureCapacityForOne_();
            ::new (&data_[size_]) T(value);
            ++size_;
        }

        /// @brief Push by move.
        void PushBack(T&& value)
        {
            EnsureCapacityForOne_();
            ::new (&data_[size_]) T(std::move(value));
            ++size_;
        }

        /// @brief In-place construct at the end.
        /// @return Reference to the new element.
        template<typename... Args>
        T& EmplaceBack(Args&&... args)
        {
            EnsureCapacityForOne_();
            T* slot = ::new (&data_[size_]) T(std::forward<Args>(args)...);
            ++size_;
            return *slot;
        }

        /// @brief Pop the last element and return it.
        T PopBack()
        {
            if (size_ == 0)
                throw std::out_of_range("Vector::PopBack: vector is empty");
            T value(std::move(data_[size_ - 1]));
            data_[size_ - 1].~T();
            --size_;
            return value;
        }

        /// @brief Remove the element at `index` by moving the last element into its slot.
        /// @details O(1). Does not preserve the order of the remaining elements.
        /// @return The removed element.
        T SwapRemove(UIntSize index)
        {
            if (index >= size_)
                throw std::out_of_range("Vector::SwapRemove: index out of range");
            T removed(std::move(data_[index]));
            const UIntSize last = size_ - 1;
            if (index != last)
            {
                data_[index].~T();
                ::new (&data_[index]) T(std::move(data_[last]));
            }
            data_[last].~T();
            --size_;
            return removed;
        }

        /// @brief Keep only the elements for which `keep(element)` is true, preserving order.
        /// @details `keep` is invoked exactly once per element, front to back. If `keep` throws, the
        /// element it threw on and every element after it are kept, and the exception propagates.
        template<class Predicate>
        void RetainIf(Predicate&& keep)
        {
            UIntSize write = 0;
            UIntSize read  = 0;
            try
            {
                for (; read < size_; ++read)
                {
                    if (!keep(data_[read]))
                        continue;
                    MoveDown_(write, read);
                    ++write;
                }
            }
            catch (...)
            {
                for (; read < size_; ++read, ++write)
                    MoveDown_(write, read);
                TruncateTo_(write);
                throw;
            }
            TruncateTo_(write);
        }

        /// @brief Remove all elements (capacity remains).
        void Clear() noexcept
        {
            for (UIntSize i = 0; i < size_; ++i)
                data_[i].~T();
            size_ = 0;
        }

        //=== Capacity management ===//

        /// @brief Ensure at least `newCapacity` slots.
        /// @throws std::length_error if the byte size overflows, std::bad_alloc on allocation failure.
        void Reserve(UIntSize newCapacity)
        {
            if (auto result = TryReserve(newCapacity); !result)
                ThrowContainerError(result.error(), "Vector::Reserve: capacity overflow");
        }

        /// @brief Ensure at least `newCapacity` slots, reporting failure instead of throwing.
        ContainerExpected<void> TryReserve(UIntSize newCapacity)
        {
            if (newCapacity <= capacity_)
                return {};
            if (newCapacity > MaxElements_())
                return std::unexpected(MakeContainerError(ContainerErrorCode::CapacityOverflow));
            void* mem = alloc_.Allocate(newCapacity * sizeof(T), alignof(T));
            if (!mem)
                return std::unexpected(MakeContainerError(ContainerErrorCode::AllocationFailed));
            Relocate_(static_cast<T*>(mem), newCapacity);
            return {};
        }

        /// @brief Shrink capacity to match size.
        void ShrinkToFit()
        {
            if (size_ == capacity_)
                return;
            if (size_ == 0)
            {
                if (data_)
                {
                    alloc_.Deallocate(data_, capacity_ * sizeof(T), alignof(T));
                    data_ = nullptr;
                }
                capacity_ = 0;
                return;
            }
            void* mem = alloc_.Allocate(size_ * sizeof(T), alignof(T));
            if (!mem)
                throw std::bad_alloc();
            Relocate_(static_cast<T*>(mem), size_);
        }

        //=== Observers ===//

        [[nodiscard]] UIntSize Size() const noexcept
        {
            return size_;
        }
        [[nodiscard]] UIntSize Capacity() const noexcept
        {
            return capacity_;
        }
        [[nodiscard]] bool IsEmpty() const noexcept
        {
            return size_ == 0;
        }
        [[nodiscard]] const Alloc& GetAllocator() const noexcept
        {
            return alloc_;
        }

        T& At(UIntSize idx)
        {
            if (idx >= size_)
                throw std::out_of_range("Vector::At: index out of range");
            return data_[idx];
        }
        const T& At(UIntSize idx) const
        {
            if (idx >= size_)
                throw std::out_of_range("Vector::At: index out of range");
            return data_[idx];
        }

        T& operator[](UIntSize idx)
        {
            return data_[idx];
        }
        const T& operator[](UIntSize idx) const
        {
            return data_[idx];
        }

        //=== Iterators & data ===//

        [[nodiscard]] T* data() noexcept
        {
            return data_;
        }
        [[nodiscard]] const T* data() const noexcept
        {
            return data_;
        }
        [[nodiscard]] T* begin() noexcept
        {
            return data_;
        }
        [[nodiscard]] const T* begin() const noexcept
        {
            return data_;
        }
        [[nodiscard]] T* end() noexcept
        {
            return data_ + size_;
        }
        [[nodiscard]] const T* end() const noexcept
        {
            return data_ + size_;
        }

    private:
        static_assert(std::is_nothrow_move_constructible_v<T>, "Vector requires nothrow move constructible elements.");

        [[nodiscard]] UIntSize MaxElements_() const noexcept
        {
            return Memory::AllocatorTraits<Alloc>::MaxSize(alloc_) / sizeof(T);
        }

        void EnsureCapacityForOne_()
        {
            if (size_ < capacity_)
                return;
            if (capacity_ > MaxElements_() / 2)
                Reserve(capacity_ + 1);
            else
                Reserve(capacity_ ? capacity_ * 2 : 4);
        }

        void MoveDown_(UIntSize to, UIntSize from) noexcept
        {
            if (to == from)
                return;
            data_[to].~T();
            ::new (&data_[to]) T(std::move(data_[from]));
        }

        void TruncateTo_(UIntSize count) noexcept
        {
            for (UIntSize i = count; i < size_; ++i)
                data_[i].~T();
            size_ = count;
        }

        /// Moves every element into `newData` (capacity `newCapacity`) and adopts it.
        void Relocate_(T* newData, UIntSize newCapacity) noexcept
        {
            for (UIntSize i = 0; i < size_; ++i)
            {
                ::new (&newData[i]) T(std::move(data_[i]));
                data_[i].~T();
            }
            if (data_)
                alloc_.Deallocate(data_, capacity_ * sizeof(T), alignof(T));
            data_     = newData;
            capacity_ = newCapacity;
        }

        void Release_() noexcept
        {
            Clear();
            if (data_)
                alloc_.Deallocate(data_, capacity_ * sizeof(T), alignof(T));
            data_     = nullptr;
            capacity_ = 0;
        }

        Alloc    alloc_ {};
        T*       data_ {nullptr};
        UIntSize size_ {0};
        UIntSize capacity_ {0};
    };

}// namespace Tandem::Containers
