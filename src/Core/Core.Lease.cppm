module;

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <expected>
#include <functional>
#include <iterator>
#include <memory>
#include <new>
#include <type_traits>
#include <unordered_map>
#include <utility>

export module Core:Lease;

import :Logging;

export namespace Core
{
    // -------------------------------------------------------------------------
    // IdleQueue - constructed-but-unused objects of one (kind, key)
    // -------------------------------------------------------------------------
    // Back = most recently released. Acquisition scans from the back so the
    // warmest object that fits wins (best-fit-by-recency). Each entry records
    // the frame it was released on so that eviction can age it out.
    //
    // Single-threaded: owned by the frame-building thread.
    // -------------------------------------------------------------------------
    template <typename T>
    class IdleQueue
    {
    public:
        struct Entry
        {
            std::unique_ptr<T> Item;
            uint64_t LastReleasedFrame = 0;
        };

        // frameClock must outlive the queue. It is read on every push.
        explicit IdleQueue(const uint64_t* frameClock) : m_FrameClock(frameClock)
        {
            assert(m_FrameClock != nullptr);
        }

        IdleQueue(const IdleQueue&) = delete;
        IdleQueue& operator=(const IdleQueue&) = delete;

        void Push(std::unique_ptr<T> item)
        {
            assert(item && "IdleQueue::Push(): null item");
            m_Entries.push_back({std::move(item), CurrentFrame()});
        }

        // Pushes to the cold end: this entry is the last candidate for reuse.
        void PushCold(std::unique_ptr<T> item)
        {
            assert(item && "IdleQueue::PushCold(): null item");
            m_Entries.push_front({std::move(item), CurrentFrame()});
        }

        // Removes and returns the most recently released entry satisfying `fits`.
        template <typename Pred>
        [[nodiscard]] std::unique_ptr<T> TakeIf(Pred&& fits)
        {
            for (auto it = m_Entries.rbegin(); it != m_Entries.rend(); ++it)
            {
                if (std::invoke(fits, std::as_const(*it->Item)))
                {
                    std::unique_ptr<T> item = std::move(it->Item);
                    m_Entries.erase(std::next(it).base());
                    return item;
                }
            }
            return nullptr;
        }

        [[nodiscard]] std::unique_ptr<T> TakeBack()
        {
            return TakeIf([](const T&) { return true; });
        }

        // Destroys every entry idle for more than `thresholdFrames` frames.
        // `visitor(const T&, uint64_t idleFrames)` sees each entry right before it is destroyed.
        template <typename Visitor>
        size_t EvictOlderThan(uint64_t thresholdFrames, Visitor&& visitor)
        {
            const uint64_t now = CurrentFrame();
            size_t evicted = 0;

            for (auto it = m_Entries.begin(); it != m_Entries.end();)
            {
                const uint64_t idleFrames = (now > it->LastReleasedFrame) ? now - it->LastReleasedFrame : 0;
                if (idleFrames > thresholdFrames)
                {
                    std::invoke(visitor, std::as_const(*it->Item), idleFrames);
                    it = m_Entries.erase(it);
                    ++evicted;
                }
                else
                {
                    ++it;
                }
            }
            return evicted;
        }

        void Clear() { m_Entries.clear(); }

        [[nodiscard]] size_t Size() const noexcept { return m_Entries.size(); }
        [[nodiscard]] bool Empty() const noexcept { return m_Entries.empty(); }
        [[nodiscard]] uint64_t CurrentFrame() const noexcept { return *m_FrameClock; }

        // Oldest-first view, for diagnostics and tests.
        [[nodiscard]] const std::deque<Entry>& Entries() const noexcept { return m_Entries; }

    private:
        const uint64_t* m_FrameClock = nullptr;
        std::deque<Entry> m_Entries;
    };

    // -------------------------------------------------------------------------
    // Lease - scoped, exclusive borrow of a pooled object
    // -------------------------------------------------------------------------
    // Owns exactly one object. On destruction the object goes back to the back
    // of the queue it came from. The lease only observes its queue (weak
    // reference): if the owning arena is gone the object is destroyed instead.
    //
    // Move-only. A moved-from lease is empty and returns nothing.
    // -------------------------------------------------------------------------
    template <typename T>
    class Lease
    {
    public:
        Lease() = default;

        Lease(std::unique_ptr<T> item, std::weak_ptr<IdleQueue<T>> origin) noexcept
            : m_Item(std::move(item)), m_Origin(std::move(origin))
        {
        }

        ~Lease() { Return(); }

        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;

        Lease(Lease&& other) noexcept
            : m_Item(std::move(other.m_Item)), m_Origin(std::move(other.m_Origin))
        {
        }

        Lease& operator=(Lease&& other) noexcept
        {
            if (this != &other)
            {
                Return();
                m_Item = std::move(other.m_Item);
                m_Origin = std::move(other.m_Origin);
            }
            return *this;
        }

        [[nodiscard]] T* Get() const noexcept { return m_Item.get(); }

        T* operator->() const noexcept
        {
            assert(m_Item && "Lease: access through an empty lease");
            return m_Item.get();
        }

        T& operator*() const noexcept
        {
            assert(m_Item && "Lease: access through an empty lease");
            return *m_Item;
        }

        [[nodiscard]] explicit operator bool() const noexcept { return m_Item != nullptr; }

        // True while the originating queue is still alive.
        [[nodiscard]] bool IsPooled() const noexcept { return !m_Origin.expired(); }

        // Detaches the object from pooling. The caller now owns it outright.
        [[nodiscard]] std::unique_ptr<T> Release() noexcept
        {
            m_Origin.reset();
            return std::move(m_Item);
        }

    private:
        void Return() noexcept
        {
            if (!m_Item) return;

            std::shared_ptr<IdleQueue<T>> queue = m_Origin.lock();
            m_Origin.reset();
            if (!queue)
            {
                // Arena torn down while leased: nothing to return to.
                m_Item.reset();
                return;
            }

            try
            {
                queue->Push(std::move(m_Item));
            }
            catch (const std::bad_alloc&)
            {
                Log::Error("Lease: out of host memory while returning an object; it will be destroyed");
                m_Item.reset();
            }
        }

        std::unique_ptr<T> m_Item;
        std::weak_ptr<IdleQueue<T>> m_Origin;
    };

    // -------------------------------------------------------------------------
    // LeaseArena - all idle queues of one resource kind, by key
    // -------------------------------------------------------------------------
    // Queues are created lazily on first request and removed only by Clear().
    // The arena is the sole strong owner of its queues; leases hold weak
    // references, so there is no ownership cycle between them.
    // -------------------------------------------------------------------------
    template <typename Key, typename T, typename Hash = std::hash<Key>>
    class LeaseArena
    {
    public:
        using QueueType = IdleQueue<T>;

        explicit LeaseArena(const uint64_t* frameClock) : m_FrameClock(frameClock)
        {
            assert(m_FrameClock != nullptr);
        }

        LeaseArena(const LeaseArena&) = delete;
        LeaseArena& operator=(const LeaseArena&) = delete;

        [[nodiscard]] const std::shared_ptr<QueueType>& QueueFor(const Key& key)
        {
            auto it = m_Queues.find(key);
            if (it == m_Queues.end())
            {
                it = m_Queues.emplace(key, std::make_shared<QueueType>(m_FrameClock)).first;
            }
            return it->second;
        }

        [[nodiscard]] const QueueType* FindQueue(const Key& key) const
        {
            const auto it = m_Queues.find(key);
            return it == m_Queues.end() ? nullptr : it->second.get();
        }

        // The acquire algorithm shared by every resource kind:
        // reuse the warmest idle object that `fits`, otherwise `construct` one.
        // `construct` returns std::expected<std::unique_ptr<T>, E>.
        template <typename Pred, typename Factory>
        [[nodiscard]] auto Acquire(const Key& key, Pred&& fits, Factory&& construct)
            -> std::expected<Lease<T>, typename std::invoke_result_t<Factory&>::error_type>
        {
            const std::shared_ptr<QueueType>& queue = QueueFor(key);

            if (std::unique_ptr<T> item = queue->TakeIf(std::forward<Pred>(fits)))
            {
                ++m_ReuseCount;
                return Lease<T>(std::move(item), queue);
            }

            auto created = std::invoke(construct);
            if (!created)
                return std::unexpected(std::move(created.error()));

            assert(*created && "LeaseArena::Acquire(): factory returned success with a null object");
            ++m_ConstructedCount;
            return Lease<T>(std::move(*created), queue);
        }

        // Places an extra, never-leased object at the cold end of a queue.
        void Seed(const Key& key, std::unique_ptr<T> item)
        {
            ++m_ConstructedCount;
            QueueFor(key)->PushCold(std::move(item));
        }

        // visitor(const Key&, const T&, uint64_t idleFrames)
        template <typename Visitor>
        size_t Evict(uint64_t thresholdFrames, Visitor&& visitor)
        {
            size_t evicted = 0;
            for (auto& [key, queue] : m_Queues)
            {
                evicted += queue->EvictOlderThan(thresholdFrames, [&](const T& item, uint64_t idleFrames)
                {
                    std::invoke(visitor, key, item, idleFrames);
                });
            }
            return evicted;
        }

        void Clear() { m_Queues.clear(); }

        [[nodiscard]] size_t IdleCount() const
        {
            size_t count = 0;
            for (const auto& [key, queue] : m_Queues)
                count += queue->Size();
            return count;
        }

        [[nodiscard]] size_t QueueCount() const noexcept { return m_Queues.size(); }
        [[nodiscard]] size_t ConstructedCount() const noexcept { return m_ConstructedCount; }
        [[nodiscard]] size_t ReuseCount() const noexcept { return m_ReuseCount; }

    private:
        const uint64_t* m_FrameClock = nullptr;
        std::unordered_map<Key, std::shared_ptr<QueueType>, Hash> m_Queues;
        size_t m_ConstructedCount = 0;
        size_t m_ReuseCount = 0;
    };
}
