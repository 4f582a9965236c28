#ifndef _BOUNDED_CACHE_H
#define _BOUNDED_CACHE_H

#include <cstdint>
#include <functional>
#include <vector>
#include <boost/optional.hpp>
#include "ordered_map.h"

// A fixed-capacity cache which evicts the least recently used entry.
//
// Recency is only updated by a get() hit and by set(). Every value that
// leaves the cache, whether evicted, replaced, filtered out or cleared, is
// passed to the onRemove hook exactly once. The hook runs synchronously
// inside the call that removed the value and must not call back into the
// same cache.
//
// Not thread-safe: callers serialise access to an instance.
template <class K, class V, class Hash = boost::hash<K>>
class BoundedCache {
public:
	typedef std::function<void(const V&)> RemoveHook;

	BoundedCache(int64_t maxEntries, RemoveHook onRemove = RemoveHook()):
		maxEntries(maxEntries < 0 ? 0 : maxEntries),
		onRemove(std::move(onRemove)) {
	}

	size_t size() const { return map.size(); }
	size_t maxSize() const { return maxEntries; }

	bool has(const K &key) const { return map.contains(key); }

	boost::optional<V> get(const K &key) {
		const V *value = map.find(key);
		if (!value) return boost::none;
		boost::optional<V> rv(*value);
		map.moveToBack(key);
		return rv;
	}

	void set(const K &key, V value) {
		if (map.contains(key)) {
			remove(key);
		} else if (map.size() >= maxEntries && !map.empty()) {
			remove(map.front().first);
		}
		// A zero-capacity cache holds nothing
		if (maxEntries == 0) return;
		map.set(key, std::move(value));
	}

	void remove(const K &key) {
		if (!map.contains(key)) return;
		V value = map.take(key);
		if (onRemove) onRemove(value);
	}

	// Shrinking below the current size evicts the oldest entries, one at a time.
	void setMaxSize(int64_t n) {
		maxEntries = n < 0 ? 0 : n;
		while (map.size() > maxEntries) {
			remove(map.front().first);
		}
	}

	// Remove every entry whose value fails `keep`. Survivors keep their order.
	void filter(std::function<bool(const V&)> keep) {
		std::vector<K> doomed;
		for (const auto &entry : map) {
			if (!keep(entry.second))
				doomed.push_back(entry.first);
		}
		for (const auto &key : doomed) {
			remove(key);
		}
	}

	void clear() {
		// Detach the contents first, so the hook never sees a half-cleared cache
		OrderedMap<K, V, Hash> old(std::move(map));
		map.clear();
		if (!onRemove) return;
		for (const auto &entry : old) {
			onRemove(entry.second);
		}
	}

	// Values from oldest to newest, without touching recency
	template<class Fn>
	void forEach(Fn fn) const {
		for (const auto &entry : map) fn(entry.first, entry.second);
	}

private:
	size_t maxEntries;
	RemoveHook onRemove;
	OrderedMap<K, V, Hash> map;
};

#endif
