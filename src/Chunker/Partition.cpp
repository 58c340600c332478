#include "Partition.hpp"

#include "../errors/errors.hpp"

#include <algorithm>
#include <string>

namespace partition
{
    namespace
    {
        PartitionPlan evenSplit(std::uint64_t size, std::uint64_t count)
        {
            PartitionPlan result;
            const std::uint64_t base = size / count;
            const std::uint64_t remainder = size % count;
            result.lengths.reserve(static_cast<std::size_t>(count));
            for (std::uint64_t i = 0; i < count; ++i)
            {
                result.lengths.push_back(base + (i < remainder ? 1 : 0));
            }
            return result;
        }
    }

    std::uint64_t PartitionPlan::total() const
    {
        std::uint64_t sum = 0;
        for (auto length : lengths)
            sum += length;
        return sum;
    }

    std::uint64_t PartitionPlan::offset(std::size_t index) const
    {
        std::uint64_t start = 0;
        for (std::size_t i = 0; i < index && i < lengths.size(); ++i)
            start += lengths[i];
        return start;
    }

    PartitionPlan plan(std::uint64_t originalSize, const SizingDirective &directive,
                       std::uint64_t defaultParts)
    {
        if (originalSize == 0)
        {
            errors::throwInvalidInput("Input file is empty");
        }

        std::uint64_t count = 0;
        switch (directive.kind)
        {
        case SizingDirective::Kind::FixedCount:
            if (directive.value < 1)
            {
                errors::throwInvalidInput("Number of parts must be at least 1");
            }
            count = static_cast<std::uint64_t>(directive.value);
            if (count > originalSize)
            {
                errors::throwInvalidInput("Cannot split " + std::to_string(originalSize) + " bytes into " +
                                          std::to_string(count) + " parts: every part needs at least one byte");
            }
            break;
        case SizingDirective::Kind::MaxPartSize:
        {
            if (directive.value < 1)
            {
                errors::throwInvalidInput("Max part size must be at least 1 byte");
            }
            const auto bound = static_cast<std::uint64_t>(directive.value);
            count = originalSize / bound + (originalSize % bound != 0 ? 1 : 0);
            break;
        }
        case SizingDirective::Kind::Default:
            if (defaultParts < 1)
            {
                errors::throwInvalidInput("Default part count must be at least 1");
            }
            count = std::min(defaultParts, originalSize);
            break;
        }

        PartitionPlan result = evenSplit(originalSize, count);

        if (directive.kind == SizingDirective::Kind::MaxPartSize)
        {
            const auto bound = static_cast<std::uint64_t>(directive.value);
            const std::uint64_t largest = result.lengths.front();
            if (largest > bound)
            {
                errors::throwInvalidInput("Cannot split file: would create parts of " + std::to_string(largest) +
                                          " bytes, exceeding limit of " + std::to_string(bound) + " bytes");
            }
        }
        return result;
    }
} // namespace partition
