#pragma once

#include "wf/Base.h"
#include "wf/Memory.h"
#include "wf/Buf.h"

#include <string.h>

namespace wf
{
	template<typename TKey, typename TValue>
	struct Key_Value
	{
		TKey key;
		TValue value;

		// key values compare by key only, that's what makes the map lookup work
		bool
		operator==(const Key_Value<TKey, TValue>& other) const
		{
			return key == other.key;
		}
	};

	// destruct overload for key values, destructs the key and the value
	template<typename TKey, typename TValue>
	inline static void
	destruct(Key_Value<TKey, TValue>& self)
	{
		destruct(self.key);
		destruct(self.value);
	}

	// default hash functor, every key type must provide a specialization
	template<typename T>
	struct Hash
	{
		inline size_t
		operator()(const T&) const
		{
			static_assert(sizeof(T) == 0, "there's no hash function defined for this type");
			return 0;
		}
	};

	// finalizer of murmur3, spreads the entropy of all the bits into the low bits used by the table mask
	inline static uint64_t
	hash_mix(uint64_t h)
	{
		h ^= h >> 33;
		h *= 0xff51afd7ed558ccdULL;
		h ^= h >> 33;
		h *= 0xc4ceb9fe1a85ec53ULL;
		h ^= h >> 33;
		return h;
	}

	template<typename T>
	struct Hash<T*>
	{
		inline size_t
		operator()(T* ptr) const
		{
			return size_t(hash_mix(uint64_t(uintptr_t(ptr))));
		}
	};

	// MurmurHash64A over the given bytes
	inline static size_t
	murmur_hash(const void* ptr, size_t len, uint64_t seed = 0xc70f6907UL)
	{
		constexpr uint64_t m = 0xc6a4a7935bd1e995ULL;
		constexpr int r = 47;

		auto data = (const unsigned char*)ptr;
		uint64_t h = seed ^ (len * m);

		size_t blocks = len / 8;
		for (size_t i = 0; i < blocks; ++i)
		{
			uint64_t k = 0;
			::memcpy(&k, data + i * 8, sizeof(k));
			k *= m;
			k ^= k >> r;
			k *= m;
			h ^= k;
			h *= m;
		}

		auto tail = data + blocks * 8;
		switch (len & 7)
		{
		case 7: h ^= uint64_t(tail[6]) << 48; [[fallthrough]];
		case 6: h ^= uint64_t(tail[5]) << 40; [[fallthrough]];
		case 5: h ^= uint64_t(tail[4]) << 32; [[fallthrough]];
		case 4: h ^= uint64_t(tail[3]) << 24; [[fallthrough]];
		case 3: h ^= uint64_t(tail[2]) << 16; [[fallthrough]];
		case 2: h ^= uint64_t(tail[1]) << 8; [[fallthrough]];
		case 1: h ^= uint64_t(tail[0]);
			h *= m;
			break;
		default: break;
		}

		h ^= h >> r;
		h *= m;
		h ^= h >> r;
		return size_t(h);
	}

	template<typename TKey, typename TValue, typename THash = Hash<TKey>>
	struct Key_Value_Hash
	{
		inline size_t
		operator()(const Key_Value<TKey, TValue>& val) const
		{
			return THash()(val.key);
		}
	};

	// a slot in the open addressing table, index is the value index + 1 so that 0 marks an empty slot
	struct Hash_Slot
	{
		size_t index;
		size_t hash;
	};

	// insert only hash set, values are stored densely in insertion order and the slots index into them
	// so iterating a set (or a map) visits the values in the order they were first inserted
	template<typename T, typename THash = Hash<T>>
	struct Set
	{
		Buf<Hash_Slot> _slots;
		Buf<T> values;
		size_t count;
	};

	template<typename T, typename THash = Hash<T>>
	inline static Set<T, THash>
	set_new()
	{
		Set<T, THash> self{};
		self._slots = buf_new<Hash_Slot>();
		self.values = buf_new<T>();
		return self;
	}

	// frees the table memory, doesn't destruct the values
	template<typename T, typename THash>
	inline static void
	set_free(Set<T, THash>& self)
	{
		buf_free(self._slots);
		buf_free(self.values);
		self.count = 0;
	}

	template<typename T, typename THash>
	inline static void
	destruct(Set<T, THash>& self)
	{
		buf_free(self._slots);
		destruct(self.values);
		self.count = 0;
	}

	// returns the slot index which holds the given key, or the empty slot where it should go
	template<typename T, typename THash>
	inline static size_t
	_set_find_slot(const Set<T, THash>& self, const T& key, size_t hash)
	{
		auto cap = self._slots.count;
		wf_assert(cap > 0 && (cap & (cap - 1)) == 0);

		// linear probing, the table is never full so this terminates
		auto ix = hash & (cap - 1);
		while (true)
		{
			const auto& slot = self._slots.ptr[ix];
			if (slot.index == 0)
				return ix;
			if (slot.hash == hash && self.values.ptr[slot.index - 1] == key)
				return ix;
			ix = (ix + 1) & (cap - 1);
		}
	}

	template<typename T, typename THash>
	inline static void
	_set_rehash(Set<T, THash>& self, size_t new_cap)
	{
		buf_resize(self._slots, new_cap);
		::memset(self._slots.ptr, 0, new_cap * sizeof(Hash_Slot));
		for (size_t i = 0; i < self.values.count; ++i)
		{
			auto hash = THash()(self.values.ptr[i]);
			auto ix = hash & (new_cap - 1);
			while (self._slots.ptr[ix].index != 0)
				ix = (ix + 1) & (new_cap - 1);
			self._slots.ptr[ix] = Hash_Slot{ i + 1, hash };
		}
	}

	// inserts the given key if it doesn't exist, returns the stored value in both cases
	template<typename T, typename THash>
	inline static T*
	set_insert(Set<T, THash>& self, const T& key)
	{
		// keep the load factor under 3/4
		if ((self.count + 1) * 4 > self._slots.count * 3)
			_set_rehash(self, self._slots.count ? self._slots.count * 2 : 16);

		auto hash = THash()(key);
		auto ix = _set_find_slot(self, key, hash);
		auto& slot = self._slots.ptr[ix];
		if (slot.index != 0)
			return self.values.ptr + slot.index - 1;

		slot.hash = hash;
		slot.index = self.values.count + 1;
		++self.count;
		return buf_push(self.values, key);
	}

	template<typename T, typename THash>
	inline static T*
	set_lookup(Set<T, THash>& self, const T& key)
	{
		if (self.count == 0)
			return nullptr;
		auto ix = _set_find_slot(self, key, THash()(key));
		auto index = self._slots.ptr[ix].index;
		if (index == 0)
			return nullptr;
		return self.values.ptr + index - 1;
	}

	template<typename T, typename THash>
	inline static const T*
	set_lookup(const Set<T, THash>& self, const T& key)
	{
		return set_lookup(const_cast<Set<T, THash>&>(self), key);
	}

	template<typename T, typename THash>
	inline static const T*
	begin(const Set<T, THash>& self)
	{
		return begin(self.values);
	}

	template<typename T, typename THash>
	inline static const T*
	end(const Set<T, THash>& self)
	{
		return end(self.values);
	}

	template<typename TKey, typename TValue, typename THash = Hash<TKey>>
	using Map = Set<Key_Value<TKey, TValue>, Key_Value_Hash<TKey, TValue, THash>>;

	template<typename TKey, typename TValue, typename THash = Hash<TKey>>
	inline static Map<TKey, TValue, THash>
	map_new()
	{
		return set_new<Key_Value<TKey, TValue>, Key_Value_Hash<TKey, TValue, THash>>();
	}

	template<typename TKey, typename TValue, typename THash>
	inline static void
	map_free(Map<TKey, TValue, THash>& self)
	{
		set_free(self);
	}

	// inserts the key value pair if the key doesn't exist, otherwise returns the existing pair untouched
	template<typename TKey, typename TValue, typename THash>
	inline static Key_Value<TKey, TValue>*
	map_insert(Map<TKey, TValue, THash>& self, const TKey& key, const TValue& value)
	{
		return set_insert(self, Key_Value<TKey, TValue>{ key, value });
	}

	template<typename TKey, typename TValue, typename THash>
	inline static Key_Value<TKey, TValue>*
	map_lookup(Map<TKey, TValue, THash>& self, const TKey& key)
	{
		return set_lookup(self, Key_Value<TKey, TValue>{ key, TValue{} });
	}

	template<typename TKey, typename TValue, typename THash>
	inline static const Key_Value<TKey, TValue>*
	map_lookup(const Map<TKey, TValue, THash>& self, const TKey& key)
	{
		return set_lookup(self, Key_Value<TKey, TValue>{ key, TValue{} });
	}
}
