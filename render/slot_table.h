#pragma once

#include <cstdint>
#include <limits>
#include <optional>
#include <utility>
#include <vector>

namespace skygrid::render {

// Opaque index + generation pair. Index 0 is the invalid sentinel.
template <typename Tag>
struct ResourceHandle {
    std::uint32_t index = 0;
    std::uint32_t generation = 0;

    [[nodiscard]] bool isValid() const { return index != 0; }
    friend bool operator==(const ResourceHandle&, const ResourceHandle&) = default;
};

// Arena of values addressed by generation-checked handles.
// A removed slot bumps its generation, so older handles to it stop resolving. A slot whose
// generation reaches `maxGeneration` is retired instead of recycled, which means a handle value
// is never issued twice in one process run.
template <typename T, typename Tag>
class SlotTable {
public:
    using Handle = ResourceHandle<Tag>;

    explicit SlotTable(std::uint32_t maxGeneration = std::numeric_limits<std::uint32_t>::max())
        : m_maxGeneration(maxGeneration) {
        // Slot 0 is reserved so a zero-initialized handle never resolves.
        m_slots.emplace_back();
    }

    Handle insert(T value) {
        std::uint32_t index = 0;
        if (!m_freeSlots.empty()) {
            index = m_freeSlots.back();
            m_freeSlots.pop_back();
        } else {
            index = static_cast<std::uint32_t>(m_slots.size());
            m_slots.emplace_back();
        }

        Slot& slot = m_slots[index];
        slot.generation += 1;
        slot.value.emplace(std::move(value));
        ++m_liveCount;
        return Handle{index, slot.generation};
    }

    [[nodiscard]] T* get(Handle handle) {
        Slot* slot = resolve(handle);
        return (slot != nullptr) ? &*slot->value : nullptr;
    }

    [[nodiscard]] const T* get(Handle handle) const {
        const Slot* slot = resolve(handle);
        return (slot != nullptr) ? &*slot->value : nullptr;
    }

    [[nodiscard]] bool contains(Handle handle) const { return resolve(handle) != nullptr; }

    // Returns the removed value so the caller can release what it owns.
    std::optional<T> remove(Handle handle) {
        Slot* slot = resolve(handle);
        if (slot == nullptr) {
            return std::nullopt;
        }
        std::optional<T> removed = std::move(slot->value);
        slot->value.reset();
        --m_liveCount;
        if (slot->generation < m_maxGeneration) {
            m_freeSlots.push_back(handle.index);
        } else {
            ++m_retiredCount;
        }
        return removed;
    }

    template <typename Fn>
    void forEach(Fn&& fn) {
        for (std::uint32_t index = 1; index < m_slots.size(); ++index) {
            Slot& slot = m_slots[index];
            if (slot.value.has_value()) {
                fn(Handle{index, slot.generation}, *slot.value);
            }
        }
    }

    // Removes every live value, handing each to `fn` first.
    template <typename Fn>
    void drain(Fn&& fn) {
        for (std::uint32_t index = 1; index < m_slots.size(); ++index) {
            Slot& slot = m_slots[index];
            if (slot.value.has_value()) {
                fn(*slot.value);
                slot.value.reset();
                if (slot.generation < m_maxGeneration) {
                    m_freeSlots.push_back(index);
                } else {
                    ++m_retiredCount;
                }
            }
        }
        m_liveCount = 0;
    }

    [[nodiscard]] std::size_t size() const { return m_liveCount; }
    [[nodiscard]] std::size_t retiredSlotCount() const { return m_retiredCount; }

private:
    struct Slot {
        std::optional<T> value;
        std::uint32_t generation = 0;
    };

    Slot* resolve(Handle handle) {
        if (handle.index == 0 || handle.index >= m_slots.size()) {
            return nullptr;
        }
        Slot& slot = m_slots[handle.index];
        if (!slot.value.has_value() || slot.generation != handle.generation) {
            return nullptr;
        }
        return &slot;
    }

    const Slot* resolve(Handle handle) const {
        return const_cast<SlotTable*>(this)->resolve(handle);
    }

    std::vector<Slot> m_slots;
    std::vector<std::uint32_t> m_freeSlots;
    std::uint32_t m_maxGeneration;
    std::size_t m_liveCount = 0;
    std::size_t m_retiredCount = 0;
};

} // namespace skygrid::render
