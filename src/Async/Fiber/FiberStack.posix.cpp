#include <Spindle/Execution/FiberStack.hpp>
#include <Spindle/Execution/FiberErrors.hpp>
#include <Spindle/Log/Log.hpp>

#include <cerrno>
#include <cstring>
#include <limits>
#include <new>
#include <string>
#include <utility>

#include <sys/mman.h>
#include <sys/resource.h>
#include <unistd.h>

namespace Spindle::Execution
{
    namespace
    {
        constexpr UIntSize AlignUp(UIntSize value, UIntSize alignment) noexcept
        {
            if (alignment <= 1)
            {
                return value;
            }
            return (value + (alignment - 1)) & ~(alignment - 1);
        }

        constexpr UIntSize AlignDown(UIntSize value, UIntSize alignment) noexcept
        {
            if (alignment <= 1)
            {
                return value;
            }
            return value & ~(alignment - 1);
        }

        // False when `value` rounded up to `alignment` does not fit in UIntSize.
        [[nodiscard]] constexpr bool TryAlignUp(UIntSize value, UIntSize alignment, UIntSize& aligned) noexcept
        {
            if (alignment > 1 && value > std::numeric_limits<UIntSize>::max() - (alignment - 1))
            {
                return false;
            }
            aligned = AlignUp(value, alignment);
            return true;
        }

        [[noreturn]] void ThrowTooLarge(UIntSize requested)
        {
            Log::Error("stack", "a stack of {} bytes cannot be represented", requested);
            throw AllocationError("FiberStack: requested size overflows the address space", requested, ENOMEM);
        }

        [[noreturn]] void ThrowErrno(const char* what, UIntSize requested)
        {
            const int err = errno;
            Log::Error("stack", "{} ({} bytes): {}", what, requested, std::strerror(err));
            throw AllocationError(std::string("FiberStack: ") + what + ": " + std::strerror(err), requested, err);
        }
    }// namespace

    UIntSize PageSize() noexcept
    {
        const long pageSize = ::sysconf(_SC_PAGESIZE);
        return pageSize > 0 ? static_cast<UIntSize>(pageSize) : 4096uz;
    }

    UIntSize SystemStackSize() noexcept
    {
        ::rlimit limit {};
        if (::getrlimit(RLIMIT_STACK, &limit) != 0 || limit.rlim_cur == RLIM_INFINITY || limit.rlim_cur == 0)
        {
            return DEFAULT_FIBER_STACK_SIZE;
        }
        return static_cast<UIntSize>(limit.rlim_cur);
    }

    Byte* StackAllocatorRef::AllocateStack(UIntSize size) const noexcept
    {
        if (size == 0)
        {
            return nullptr;
        }
        if (IsDefault())
        {
            return static_cast<Byte*>(::operator new(size, std::align_val_t {FIBER_STACK_ALIGNMENT}, std::nothrow));
        }
        return static_cast<Byte*>(m_allocate(m_target, size));
    }

    void StackAllocatorRef::DeallocateStack(Byte* base, UIntSize size) const noexcept
    {
        if (!base)
        {
            return;
        }
        if (IsDefault())
        {
            ::operator delete(base, std::align_val_t {FIBER_STACK_ALIGNMENT});
            return;
        }
        m_deallocate(m_target, base, size);
    }

    UIntSize FiberStack::UsableSize(const FiberStackOptions& options) noexcept
    {
        const UIntSize requested = options.stackSize == 0 ? DEFAULT_FIBER_STACK_SIZE : options.stackSize;
        UIntSize       usable    = 0;
        // 0 when the rounded size does not fit; Allocate rejects such requests.
        (void) TryAlignUp(requested, options.guardPages ? PageSize() : FIBER_STACK_ALIGNMENT, usable);
        return usable;
    }

    FiberStack FiberStack::Allocate(const FiberStackOptions& options)
    {
        const UIntSize requested = options.stackSize == 0 ? DEFAULT_FIBER_STACK_SIZE : options.stackSize;
        const UIntSize usable    = UsableSize(options);
        if (usable == 0)
        {
            ThrowTooLarge(requested);
        }

        FiberStack stack;
        if (options.guardPages)
        {
            const UIntSize page      = PageSize();
            UIntSize       guardSize = 0;
            if (!TryAlignUp(options.guardSize != 0 ? options.guardSize : page, page, guardSize)
                || guardSize > std::numeric_limits<UIntSize>::max() - usable)
            {
                ThrowTooLarge(requested);
            }
            const UIntSize totalSize = guardSize + usable;

            int mmapFlags = MAP_PRIVATE | MAP_ANONYMOUS;
#if defined(MAP_STACK)
            mmapFlags |= MAP_STACK;
#endif
            void* region = ::mmap(nullptr, totalSize, PROT_READ | PROT_WRITE, mmapFlags, -1, 0);
            if (region == MAP_FAILED)
            {
                ThrowErrno("mmap failed", totalSize);
            }

            if (::mprotect(region, guardSize, PROT_NONE) != 0)
            {
                const int err = errno;
                (void) ::munmap(region, totalSize);
                errno = err;
                ThrowErrno("mprotect guard pages failed", totalSize);
            }

            stack.m_allocationBase = static_cast<Byte*>(region);
            stack.m_allocationSize = totalSize;
            stack.m_base           = stack.m_allocationBase + guardSize;
            stack.m_size           = usable;
            stack.m_mapped         = true;
            return stack;
        }

        stack.m_allocator = options.allocator;
        stack.m_base      = stack.m_allocator.AllocateStack(usable);
        if (!stack.m_base)
        {
            throw AllocationError("FiberStack: allocator returned no memory", usable);
        }
        stack.m_allocationBase = stack.m_base;
        stack.m_allocationSize = usable;
        stack.m_size           = usable;
        stack.m_mapped         = false;
        return stack;
    }

    FiberStack::~FiberStack()
    {
        Reset();
    }

    FiberStack::FiberStack(FiberStack&& other) noexcept
        : m_allocationBase(std::exchange(other.m_allocationBase, nullptr))
        , m_allocationSize(std::exchange(other.m_allocationSize, 0))
        , m_base(std::exchange(other.m_base, nullptr))
        , m_size(std::exchange(other.m_size, 0))
        , m_allocator(std::exchange(other.m_allocator, StackAllocatorRef {}))
        , m_mapped(std::exchange(other.m_mapped, false))
    {
    }

    FiberStack& FiberStack::operator=(FiberStack&& other) noexcept
    {
        if (this != &other)
        {
            Reset();
            m_allocationBase = std::exchange(other.m_allocationBase, nullptr);
            m_allocationSize = std::exchange(other.m_allocationSize, 0);
            m_base           = std::exchange(other.m_base, nullptr);
            m_size           = std::exchange(other.m_size, 0);
            m_allocator      = std::exchange(other.m_allocator, StackAllocatorRef {});
            m_mapped         = std::exchange(other.m_mapped, false);
        }
        return *this;
    }

    void* FiberStack::Top() const noexcept
    {
        if (!m_base)
        {
            return nullptr;
        }
        const auto top = reinterpret_cast<UIntPtr>(m_base + m_size);
        return reinterpret_cast<void*>(AlignDown(top, FIBER_STACK_ALIGNMENT));
    }

    bool FiberStack::Contains(const void* address) const noexcept
    {
        const auto value = reinterpret_cast<UIntPtr>(address);
        const auto base  = reinterpret_cast<UIntPtr>(m_base);
        return m_base != nullptr && value >= base && value < base + m_size;
    }

    void FiberStack::Discard(const void* liveBottom)
    {
        if (!m_mapped || !m_base)
        {
            return;
        }

        const UIntSize page  = PageSize();
        const auto     base  = reinterpret_cast<UIntPtr>(m_base);
        const auto     limit = reinterpret_cast<UIntPtr>(liveBottom);
        if (limit <= base)
        {
            return;
        }

        const UIntPtr begin = AlignUp(base, page);
        const UIntPtr end   = AlignDown(limit < base + m_size ? limit : base + m_size, page);
        if (end <= begin)
        {
            return;
        }

        void* const    start  = reinterpret_cast<void*>(begin);
        const UIntSize length = end - begin;
#if defined(MADV_FREE)
        int result = ::madvise(start, length, MADV_FREE);
        if (result != 0 && errno == EINVAL)
        {
            // Kernels before 4.5 reject MADV_FREE.
            result = ::madvise(start, length, MADV_DONTNEED);
        }
#else
        const int result = ::madvise(start, length, MADV_DONTNEED);
#endif
        if (result != 0)
        {
            // Advisory only: the pages stay resident.
            Log::Debug("stack", "madvise on {} bytes failed: {}", length, std::strerror(errno));
        }
    }

    void FiberStack::Reset() noexcept
    {
        if (!m_base)
        {
            return;
        }
        if (m_mapped)
        {
            (void) ::munmap(m_allocationBase, m_allocationSize);
        }
        else
        {
            m_allocator.DeallocateStack(m_base, m_size);
        }
        m_allocationBase = nullptr;
        m_allocationSize = 0;
        m_base           = nullptr;
        m_size           = 0;
        m_mapped         = false;
    }
}// namespace Spindle::Execution
