module;

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <type_traits>
#include <utility>

export module Core:RetireQueue;

export namespace Core
{
    // Type-erased holder for a value whose destruction must wait for the GPU.
    class Droppable
    {
    public:
        virtual ~Droppable() = default;
    };

    template <typename T>
    class DroppableBox final : public Droppable
    {
    public:
        explicit DroppableBox(T&& value) : m_Value(std::move(value)) {}

        [[nodiscard]] T& Get() noexcept { return m_Value; }

    private:
        T m_Value;
    };

    // -------------------------------------------------------------------------
    // RetireQueue - deferred destruction keyed by a monotonic generation
    // -------------------------------------------------------------------------
    // Values are pushed with the generation after which they are safe to
    // destroy. Generations must be pushed in non-decreasing order.
    // Sweep(completed) destroys every value whose generation <= completed,
    // oldest first.
    // -------------------------------------------------------------------------
    class RetireQueue
    {
    public:
        RetireQueue() = default;
        ~RetireQueue() = default;

        RetireQueue(const RetireQueue&) = delete;
        RetireQueue& operator=(const RetireQueue&) = delete;
        RetireQueue(RetireQueue&&) noexcept = default;
        RetireQueue& operator=(RetireQueue&&) noexcept = default;

        template <typename T>
        void Push(uint64_t generation, T&& value)
        {
            static_assert(!std::is_lvalue_reference_v<T>, "RetireQueue::Push() takes ownership: pass an rvalue");
            assert((m_Entries.empty() || m_Entries.back().Generation <= generation) &&
                "RetireQueue::Push(): generations must be non-decreasing");

            m_Entries.push_back({generation, std::make_unique<DroppableBox<std::decay_t<T>>>(std::move(value))});
        }

        // Returns the number of values destroyed.
        size_t Sweep(uint64_t completedGeneration)
        {
            size_t dropped = 0;
            while (!m_Entries.empty() && m_Entries.front().Generation <= completedGeneration)
            {
                m_Entries.pop_front();
                ++dropped;
            }
            return dropped;
        }

        void Clear() { m_Entries.clear(); }

        [[nodiscard]] size_t Size() const noexcept { return m_Entries.size(); }
        [[nodiscard]] bool Empty() const noexcept { return m_Entries.empty(); }

        [[nodiscard]] uint64_t OldestGeneration() const noexcept
        {
            return m_Entries.empty() ? 0 : m_Entries.front().Generation;
        }

    private:
        struct Entry
        {
            uint64_t Generation = 0;
            std::unique_ptr<Droppable> Value;
        };

        std::deque<Entry> m_Entries;
    };
}
