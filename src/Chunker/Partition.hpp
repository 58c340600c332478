#ifndef PARTITION_HPP
#define PARTITION_HPP

#include <cstddef>
#include <cstdint>
#include <vector>

namespace partition
{
    constexpr std::uint64_t kDefaultParts = 24;

    // How the caller wants the file cut.
    struct SizingDirective
    {
        enum class Kind
        {
            Default,
            FixedCount,
            MaxPartSize
        };

        Kind kind = Kind::Default;
        std::int64_t value = 0; // part count or byte bound, unused for Default

        static SizingDirective defaults() { return SizingDirective{}; }
        static SizingDirective fixedCount(std::int64_t parts) { return SizingDirective{Kind::FixedCount, parts}; }
        static SizingDirective maxPartSize(std::int64_t bytes) { return SizingDirective{Kind::MaxPartSize, bytes}; }
    };

    struct PartitionPlan
    {
        std::vector<std::uint64_t> lengths;

        std::size_t count() const { return lengths.size(); }
        std::uint64_t total() const;
        // Byte offset where part i starts in the source.
        std::uint64_t offset(std::size_t index) const;
    };

    /**
     * @brief Cut originalSize bytes into ordered, contiguous parts.
     *
     * Lengths differ by at most one byte; the first (size % count) parts carry the extra byte.
     * Default uses min(defaultParts, originalSize) parts.
     *
     * @throws errors::AfsError(InvalidInput) for an empty source, a non-positive count or bound,
     *         more parts than bytes, or a bound the resulting parts would exceed.
     */
    PartitionPlan plan(std::uint64_t originalSize, const SizingDirective &directive,
                       std::uint64_t defaultParts = kDefaultParts);
} // namespace partition

#endif // PARTITION_HPP
