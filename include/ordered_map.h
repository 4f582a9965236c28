#ifndef ORDERED_MAP_H
#define ORDERED_MAP_H

#include <list>
#include <unordered_map>
#include <utility>
#include <boost/functional/hash.hpp>

// A hash map which remembers the order in which keys joined.
//
// Overwriting an existing key keeps its position; erasing and re-adding a
// key moves it to the back. Iteration runs from the oldest key to the newest.
//
// Used as the id-indexed view of features and diffs (where output order
// should follow input order) and as the recency list of BoundedCache.
template <class K, class V, class Hash = boost::hash<K>>
class OrderedMap {
public:
	typedef std::pair<K, V> value_type;
	typedef typename std::list<value_type>::iterator iterator;
	typedef typename std::list<value_type>::const_iterator const_iterator;

	OrderedMap() {}

	OrderedMap(const OrderedMap &other) {
		for (const auto &entry : other.entries)
			set(entry.first, entry.second);
	}

	OrderedMap& operator=(const OrderedMap &other) {
		if (this != &other) {
			clear();
			for (const auto &entry : other.entries)
				set(entry.first, entry.second);
		}
		return *this;
	}

	// list iterators survive a move, so the index stays valid
	OrderedMap(OrderedMap &&other) = default;
	OrderedMap& operator=(OrderedMap &&other) = default;

	size_t size() const { return entries.size(); }
	bool empty() const { return entries.empty(); }

	bool contains(const K &key) const {
		return index.find(key) != index.end();
	}

	// Returns a pointer to the value for `key`, or nullptr if absent.
	V* find(const K &key) {
		auto it = index.find(key);
		if (it == index.end()) return nullptr;
		return &it->second->second;
	}

	const V* find(const K &key) const {
		auto it = index.find(key);
		if (it == index.end()) return nullptr;
		return &it->second->second;
	}

	// Insert at the back, or overwrite in place if `key` is already present.
	void set(const K &key, V value) {
		auto it = index.find(key);
		if (it != index.end()) {
			it->second->second = std::move(value);
			return;
		}
		entries.emplace_back(key, std::move(value));
		index.emplace(key, std::prev(entries.end()));
	}

	// Returns true if an entry was removed.
	bool erase(const K &key) {
		auto it = index.find(key);
		if (it == index.end()) return false;
		entries.erase(it->second);
		index.erase(it);
		return true;
	}

	// Remove `key` and hand back its value; the caller must check contains() first.
	V take(const K &key) {
		auto it = index.find(key);
		V value = std::move(it->second->second);
		entries.erase(it->second);
		index.erase(it);
		return value;
	}

	// Make `key` the newest entry. No-op if absent.
	void moveToBack(const K &key) {
		auto it = index.find(key);
		if (it == index.end()) return;
		entries.splice(entries.end(), entries, it->second);
	}

	// Oldest entry; the map must not be empty.
	const value_type& front() const { return entries.front(); }

	void clear() {
		index.clear();
		entries.clear();
	}

	iterator begin() { return entries.begin(); }
	iterator end() { return entries.end(); }
	const_iterator begin() const { return entries.begin(); }
	const_iterator end() const { return entries.end(); }

private:
	std::list<value_type> entries;
	std::unordered_map<K, iterator, Hash> index;
};

#endif
