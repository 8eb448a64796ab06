#ifndef KEYMORPH_CONCURRENT_HASH_MAP_HPP
#define KEYMORPH_CONCURRENT_HASH_MAP_HPP

#include <atomic>
#include <cstddef>
#include <functional>
#include <optional>
#include <utility>
#include <vector>

namespace keymorph {

/**
 * Insert-only lock-free hash map.
 * Buckets are singly linked lists grown by CAS at the head; nodes are never
 * unlinked while the map is shared, so readers need no reclamation scheme.
 */
template<typename Key, typename Value, typename Hash = std::hash<Key>>
class ConcurrentHashMap {
private:
    struct Node {
        Node* next = nullptr;
        Key key;
        Value value;

        Node(const Key& k, const Value& v) : key(k), value(v) {}
    };

    struct Bucket {
        std::atomic<Node*> head{nullptr};
    };

    static constexpr std::size_t DEFAULT_BUCKET_COUNT = 1024;

    std::vector<Bucket> buckets_;
    std::atomic<std::size_t> size_{0};
    Hash hasher_;

    std::size_t bucket_index(const Key& key) const {
        return hasher_(key) % buckets_.size();
    }

    static Node* find_in(Node* node, const Key& key) {
        for (; node != nullptr; node = node->next) {
            if (node->key == key) return node;
        }
        return nullptr;
    }

public:
    explicit ConcurrentHashMap(std::size_t bucket_count = DEFAULT_BUCKET_COUNT)
        : buckets_(bucket_count == 0 ? 1 : bucket_count) {}

    ~ConcurrentHashMap() {
        clear();
    }

    ConcurrentHashMap(const ConcurrentHashMap&) = delete;
    ConcurrentHashMap& operator=(const ConcurrentHashMap&) = delete;

    /**
     * Insert if absent, otherwise return the stored value.
     * Returns (value, was_inserted); exactly one caller wins for a given key.
     */
    std::pair<Value, bool> insert_or_get(const Key& key, const Value& value) {
        Bucket& bucket = buckets_[bucket_index(key)];
        Node* new_node = nullptr;

        Node* head = bucket.head.load(std::memory_order_acquire);
        while (true) {
            if (Node* existing = find_in(head, key)) {
                delete new_node;
                return {existing->value, false};
            }

            if (!new_node) {
                new_node = new Node(key, value);
            }

            // On failure `head` is reloaded and the new prefix rescanned
            new_node->next = head;
            if (bucket.head.compare_exchange_weak(head, new_node,
                                                  std::memory_order_release,
                                                  std::memory_order_acquire)) {
                size_.fetch_add(1, std::memory_order_relaxed);
                return {value, true};
            }
        }
    }

    std::optional<Value> find(const Key& key) const {
        const Bucket& bucket = buckets_[bucket_index(key)];
        if (Node* node = find_in(bucket.head.load(std::memory_order_acquire), key)) {
            return node->value;
        }
        return std::nullopt;
    }

    bool contains(const Key& key) const {
        return find(key).has_value();
    }

    std::size_t size() const {
        return size_.load(std::memory_order_relaxed);
    }

    bool empty() const {
        return size() == 0;
    }

    /**
     * Drop all entries. Not safe against concurrent readers.
     */
    void clear() {
        for (auto& bucket : buckets_) {
            Node* head = bucket.head.exchange(nullptr, std::memory_order_acq_rel);
            while (head != nullptr) {
                Node* next = head->next;
                delete head;
                head = next;
            }
        }
        size_.store(0, std::memory_order_relaxed);
    }

    template<typename Func>
    void for_each(Func&& func) const {
        for (const auto& bucket : buckets_) {
            for (Node* node = bucket.head.load(std::memory_order_acquire); node != nullptr; node = node->next) {
                func(node->key, node->value);
            }
        }
    }
};

} // namespace keymorph

#endif // KEYMORPH_CONCURRENT_HASH_MAP_HPP
