#pragma once

#include "vmk/memory/mapper.hpp"

#include <span>

namespace vmk {
    /// @brief An owned range of mapped pages.
    ///
    /// While this object is alive the entries covering its pages are present
    /// and carry its flags. Destroying it unmaps the pages, frees any
    /// exclusively owned frames, and returns the pages to their allocator.
    class MappedPages {
        friend class Mapper;

        AllocatedPages mPages;
        PteFlags mFlags = PteFlags::eNone;
        Frame mRoot;
        Mapper *mMapper = nullptr;

        MappedPages(AllocatedPages&& pages, PteFlags flags, Frame root, Mapper *mapper) noexcept
            : mPages(std::move(pages))
            , mFlags(flags)
            , mRoot(root)
            , mMapper(mapper)
        { }

        void release() noexcept;

    public:
        UTIL_NOCOPY(MappedPages);

        MappedPages() noexcept = default;

        MappedPages(MappedPages&& other) noexcept
            : mPages(std::move(other.mPages))
            , mFlags(other.mFlags)
            , mRoot(other.mRoot)
            , mMapper(std::exchange(other.mMapper, nullptr))
        { }

        MappedPages& operator=(MappedPages&& other) noexcept;

        ~MappedPages() noexcept {
            release();
        }

        PageRange pages() const noexcept { return mPages.range(); }
        PteFlags flags() const noexcept { return mFlags; }
        Frame root() const noexcept { return mRoot; }
        Mapper *mapper() const noexcept { return mMapper; }

        VirtualAddress startAddress() const noexcept { return mPages.range().startAddress(); }
        size_t count() const noexcept { return mPages.count(); }
        size_t sizeInBytes() const noexcept { return mPages.range().sizeInBytes(); }
        bool isEmpty() const noexcept { return mPages.isEmpty(); }

        std::optional<size_t> offsetOfAddress(VirtualAddress address) const noexcept {
            return mPages.range().offsetOfAddress(address);
        }

        std::optional<VirtualAddress> addressAtOffset(size_t offset) const noexcept {
            return mPages.range().addressAtOffset(offset);
        }

        /// @brief Copy bytes out of the mapping.
        ///
        /// @pre The mapping must belong to the active page table.
        ///
        /// @return OsStatusOutOfBounds if the read extends past the end of the mapping.
        [[nodiscard]]
        OsStatus read(size_t offset, std::span<std::byte> dst) const noexcept;

        /// @brief Copy bytes into the mapping.
        ///
        /// @return OsStatusAccessDenied if the mapping is not writable.
        [[nodiscard]]
        OsStatus write(size_t offset, std::span<const std::byte> src) noexcept;

        /// @brief Absorb mappings that directly follow this one.
        ///
        /// Every mapping must share this mapping's flags and page table and
        /// each must begin where the previous one ends. On success the
        /// absorbed mappings are left empty. On failure nothing is changed.
        [[nodiscard]]
        OsStatus merge(std::span<MappedPages> mappings) noexcept;

        /// @brief Create a new mapping of the same size holding a copy of this one.
        ///
        /// @param flags The flags of the copy.
        /// @param result The new mapping.
        [[nodiscard]]
        OsStatus deepCopy(PteFlags flags, MappedPages *result) const noexcept;
    };
}
