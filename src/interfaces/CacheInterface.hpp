#ifndef CACHEINTERFACE_HPP
#define CACHEINTERFACE_HPP

#include <chrono>
#include <cstddef>
#include <optional>

template <typename K, typename V>
class CacheInterface {
public:
    virtual ~CacheInterface() = default;
    virtual std::optional<V> get(const K& key) = 0;
    virtual void put(const K& key, const V& value) = 0;
    // ttl <= 0 stores the entry without expiry
    virtual void put(const K& key, const V& value, std::chrono::milliseconds ttl) = 0;
    virtual bool remove(const K& key) = 0;
    virtual void clear() = 0;
    virtual bool exists(const K& key) = 0;
    virtual std::size_t size() const = 0;
    virtual void shutdown() = 0;
};

#endif // CACHEINTERFACE_HPP
