#include "Teul/Core/IdGenerator.h"

#include <array>

namespace
{
    void writeBigEndian(juce::uint8* out, juce::int64 value) noexcept
    {
        auto bits = static_cast<juce::uint64>(value);
        for (int i = 7; i >= 0; --i)
        {
            out[i] = static_cast<juce::uint8>(bits & 0xff);
            bits >>= 8;
        }
    }
}

namespace Teul::Core
{
    Seed Seed::fromWords(juce::uint32 w0, juce::uint32 w1, juce::uint32 w2, juce::uint32 w3) noexcept
    {
        const auto high = (static_cast<juce::uint64>(w0) << 32) | w1;
        const auto low = (static_cast<juce::uint64>(w2) << 32) | w3;
        return { static_cast<juce::int64>(high ^ (low * 0x9e3779b97f4a7c15ULL)) };
    }

    GeneratedId generateId(Seed seed)
    {
        juce::Random random(seed.value);

        std::array<juce::uint8, 16> raw {};
        writeBigEndian(raw.data(), random.nextInt64());
        writeBigEndian(raw.data() + 8, random.nextInt64());

        // RFC 4122 version 4 / variant 1 layout
        raw[6] = static_cast<juce::uint8>((raw[6] & 0x0f) | 0x40);
        raw[8] = static_cast<juce::uint8>((raw[8] & 0x3f) | 0x80);

        return { NodeId(raw.data()), Seed { random.getSeed() } };
    }

    StampedTree stampFreshIds(const Tree& subtree, Seed seed)
    {
        auto label = subtree.label();
        const auto generated = generateId(seed);
        label.id = generated.id;

        auto next = generated.next;
        std::vector<Tree> children;
        children.reserve(subtree.children().size());
        for (const auto& child : subtree.children())
        {
            auto stamped = stampFreshIds(child, next);
            children.push_back(std::move(stamped.tree));
            next = stamped.next;
        }

        return { Tree(std::move(label), std::move(children)), next };
    }
}
