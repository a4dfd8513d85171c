#include "wirepack/msgpack/Value.h"
#include "wirepack/Hash.h"

#include <cmath>
#include <cstring>
#include <limits>
#include <new>

namespace wirepack::msgpack
{
	constexpr double TWO_POW_63 = 9223372036854775808.0;
	constexpr double TWO_POW_64 = 18446744073709551616.0;

	template<typename T>
	inline static T* box(Allocator* allocator, T&& value)
	{
		validate(allocator != nullptr);
		auto ptr = allocator->allocSingleT<T>();
		allocator->commitSingleT(ptr);
		return ::new (ptr) T(std::move(value));
	}

	template<typename T>
	inline static void unbox(Allocator* allocator, T* ptr)
	{
		ptr->~T();
		allocator->releaseSingleT(ptr);
		allocator->freeSingleT(ptr);
	}

	inline static bool isIntegral(double d)
	{
		return std::isfinite(d) && std::trunc(d) == d;
	}

	inline static size_t hashStringBytes(StringView str, size_t seed)
	{
		return hashBytes(Span<const std::byte>(str), seed ^ Value::KIND_STRING);
	}

	inline static size_t hashDouble(double d, size_t seed)
	{
		if (isIntegral(d))
		{
			if (d >= -TWO_POW_63 && d < TWO_POW_63)
				return Hash<int64_t>{}(int64_t(d), seed);
			if (d >= 0 && d < TWO_POW_64)
				return Hash<uint64_t>{}(uint64_t(d), seed);
		}
		// every nan is the same value
		if (std::isnan(d))
			d = std::numeric_limits<double>::quiet_NaN();
		uint64_t bits = 0;
		::memcpy(&bits, &d, sizeof(bits));
		return Hash<uint64_t>{}(bits, seed);
	}

	inline static bool integerEqualsDouble(const Value& integer, double d)
	{
		if (isIntegral(d) == false)
			return false;

		if (integer.kind() == Value::KIND_INT)
		{
			if (d < -TWO_POW_63 || d >= TWO_POW_63)
				return false;
			return int64_t(d) == integer.as_int();
		}
		else
		{
			if (d < 0 || d >= TWO_POW_64)
				return false;
			return uint64_t(d) == integer.as_uint();
		}
	}

	inline static bool numbersEqual(const Value& a, const Value& b)
	{
		auto a_integer = a.kind() == Value::KIND_INT || a.kind() == Value::KIND_UINT;
		auto b_integer = b.kind() == Value::KIND_INT || b.kind() == Value::KIND_UINT;

		if (a_integer && b_integer)
		{
			if (a.kind() == b.kind())
				return a.kind() == Value::KIND_INT ? a.as_int() == b.as_int() : a.as_uint() == b.as_uint();

			const auto& signed_value = a.kind() == Value::KIND_INT ? a : b;
			const auto& unsigned_value = a.kind() == Value::KIND_INT ? b : a;
			if (signed_value.as_int() < 0)
				return false;
			return uint64_t(signed_value.as_int()) == unsigned_value.as_uint();
		}
		else if (a_integer)
		{
			return integerEqualsDouble(a, b.to_double());
		}
		else if (b_integer)
		{
			return integerEqualsDouble(b, a.to_double());
		}
		else
		{
			auto x = a.to_double();
			auto y = b.to_double();
			if (std::isnan(x) && std::isnan(y))
				return true;
			return x == y;
		}
	}

	Value::Value(String value)
		: m_kind(KIND_STRING),
		  m_allocator(value.allocator())
	{
		m_string = box(m_allocator, std::move(value));
	}

	Value::Value(Buffer value)
		: m_kind(KIND_BYTES),
		  m_allocator(value.allocator())
	{
		m_bytes = box(m_allocator, std::move(value));
	}

	Value::Value(Array<Value> value)
		: m_kind(KIND_ARRAY),
		  m_allocator(value.allocator())
	{
		m_array = box(m_allocator, std::move(value));
	}

	Value::Value(Map value)
		: m_kind(KIND_MAP),
		  m_allocator(value.allocator())
	{
		m_map = box(m_allocator, std::move(value));
	}

	Value::Value(Ext value)
		: m_kind(KIND_EXT),
		  m_allocator(value.allocator())
	{
		m_ext = box(m_allocator, std::move(value));
	}

	Value::Value(Shared<Object> value)
	{
		// a null object is indistinguishable from nil
		if (value == nullptr)
			return;

		m_kind = KIND_OBJECT;
		m_allocator = value.allocator();
		m_object = box(m_allocator, std::move(value));
	}

	double Value::to_double() const
	{
		switch (m_kind)
		{
		case KIND_INT: return double(m_int);
		case KIND_UINT: return double(m_uint);
		case KIND_FLOAT: return double(m_float);
		case KIND_DOUBLE: return m_double;
		default:
			unreachableMsg("to_double called on a non numeric value");
			return 0;
		}
	}

	bool Value::operator==(const Value& other) const
	{
		if (is_number() && other.is_number())
			return numbersEqual(*this, other);

		if (m_kind != other.m_kind)
			return false;

		switch (m_kind)
		{
		case KIND_NIL:
			return true;
		case KIND_BOOL:
			return m_bool == other.m_bool;
		case KIND_STRING:
			return *m_string == *other.m_string;
		case KIND_BYTES:
			return *m_bytes == *other.m_bytes;
		case KIND_ARRAY:
		{
			if (m_array->count() != other.m_array->count())
				return false;
			for (size_t i = 0; i < m_array->count(); ++i)
				if ((*m_array)[i] != (*other.m_array)[i])
					return false;
			return true;
		}
		case KIND_MAP:
			return *m_map == *other.m_map;
		case KIND_EXT:
			return *m_ext == *other.m_ext;
		case KIND_OBJECT:
			return *m_object == *other.m_object;
		default:
			unreachable();
			return false;
		}
	}

	size_t Value::hash(size_t seed) const
	{
		switch (m_kind)
		{
		case KIND_NIL:
			return Hash<uint64_t>{}(0, seed ^ KIND_NIL);
		case KIND_BOOL:
			return Hash<uint64_t>{}(m_bool ? 1 : 0, seed ^ KIND_BOOL);
		// equal numbers of different kinds must land on the same hash
		case KIND_INT:
			return Hash<int64_t>{}(m_int, seed);
		case KIND_UINT:
			if (m_uint <= uint64_t(INT64_MAX))
				return Hash<int64_t>{}(int64_t(m_uint), seed);
			return Hash<uint64_t>{}(m_uint, seed);
		case KIND_FLOAT:
			return hashDouble(double(m_float), seed);
		case KIND_DOUBLE:
			return hashDouble(m_double, seed);
		case KIND_STRING:
			return hashStringBytes(*m_string, seed);
		case KIND_BYTES:
			return hashBytes(*m_bytes, seed ^ KIND_BYTES);
		case KIND_ARRAY:
		{
			auto h = Hash<uint64_t>{}(m_array->count(), seed ^ KIND_ARRAY);
			for (const auto& element: *m_array)
				h = element.hash(h);
			return h;
		}
		case KIND_MAP:
		{
			auto h = Hash<uint64_t>{}(m_map->count(), seed ^ KIND_MAP);
			for (const auto& entry: *m_map)
				h = entry.value.hash(entry.key.hash(h));
			return h;
		}
		case KIND_EXT:
			return hashBytes(m_ext->bytes(), Hash<int64_t>{}(m_ext->type(), seed ^ KIND_EXT));
		case KIND_OBJECT:
			return Hash<Object*>{}(m_object->get(), seed ^ KIND_OBJECT);
		default:
			unreachable();
			return seed;
		}
	}

	void Value::destroy()
	{
		switch (m_kind)
		{
		case KIND_NIL:
		case KIND_BOOL:
		case KIND_INT:
		case KIND_UINT:
		case KIND_FLOAT:
		case KIND_DOUBLE:
			break;
		case KIND_STRING:
			unbox(m_allocator, m_string);
			break;
		case KIND_BYTES:
			unbox(m_allocator, m_bytes);
			break;
		case KIND_ARRAY:
			unbox(m_allocator, m_array);
			break;
		case KIND_MAP:
			unbox(m_allocator, m_map);
			break;
		case KIND_EXT:
			unbox(m_allocator, m_ext);
			break;
		case KIND_OBJECT:
			unbox(m_allocator, m_object);
			break;
		default:
			unreachable();
			break;
		}
		m_kind = KIND_NIL;
		m_allocator = nullptr;
	}

	void Value::copyFrom(const Value& other)
	{
		m_kind = other.m_kind;
		m_allocator = other.m_allocator;
		switch (m_kind)
		{
		case KIND_NIL:
			break;
		case KIND_BOOL:
			m_bool = other.m_bool;
			break;
		case KIND_INT:
			m_int = other.m_int;
			break;
		case KIND_UINT:
			m_uint = other.m_uint;
			break;
		case KIND_FLOAT:
			m_float = other.m_float;
			break;
		case KIND_DOUBLE:
			m_double = other.m_double;
			break;
		case KIND_STRING:
			m_string = box(m_allocator, String{*other.m_string});
			break;
		case KIND_BYTES:
			m_bytes = box(m_allocator, Buffer{*other.m_bytes});
			break;
		case KIND_ARRAY:
			m_array = box(m_allocator, Array<Value>{*other.m_array});
			break;
		case KIND_MAP:
			m_map = box(m_allocator, Map{*other.m_map});
			break;
		case KIND_EXT:
			m_ext = box(m_allocator, Ext{*other.m_ext});
			break;
		case KIND_OBJECT:
			m_object = box(m_allocator, Shared<Object>{*other.m_object});
			break;
		default:
			unreachable();
			break;
		}
	}

	void Value::moveFrom(Value&& other)
	{
		m_kind = other.m_kind;
		m_allocator = other.m_allocator;
		switch (m_kind)
		{
		case KIND_NIL:
			break;
		case KIND_BOOL:
			m_bool = other.m_bool;
			break;
		case KIND_INT:
			m_int = other.m_int;
			break;
		case KIND_UINT:
			m_uint = other.m_uint;
			break;
		case KIND_FLOAT:
			m_float = other.m_float;
			break;
		case KIND_DOUBLE:
			m_double = other.m_double;
			break;
		case KIND_STRING:
			m_string = other.m_string;
			break;
		case KIND_BYTES:
			m_bytes = other.m_bytes;
			break;
		case KIND_ARRAY:
			m_array = other.m_array;
			break;
		case KIND_MAP:
			m_map = other.m_map;
			break;
		case KIND_EXT:
			m_ext = other.m_ext;
			break;
		case KIND_OBJECT:
			m_object = other.m_object;
			break;
		default:
			unreachable();
			break;
		}
		other.m_kind = KIND_NIL;
		other.m_allocator = nullptr;
	}

	StringView kindName(Value::KIND kind)
	{
		switch (kind)
		{
		case Value::KIND_NIL: return "nil"_sv;
		case Value::KIND_BOOL: return "bool"_sv;
		case Value::KIND_INT: return "int"_sv;
		case Value::KIND_UINT: return "uint"_sv;
		case Value::KIND_FLOAT: return "float"_sv;
		case Value::KIND_DOUBLE: return "double"_sv;
		case Value::KIND_STRING: return "string"_sv;
		case Value::KIND_BYTES: return "bytes"_sv;
		case Value::KIND_ARRAY: return "array"_sv;
		case Value::KIND_MAP: return "map"_sv;
		case Value::KIND_EXT: return "ext"_sv;
		case Value::KIND_OBJECT: return "object"_sv;
		default:
			unreachable();
			return "<unknown>"_sv;
		}
	}

	void Map::rebuildIndex()
	{
		m_index.clear();
		m_index.reserve(m_entries.count());
		for (size_t i = 0; i < m_entries.count(); ++i)
			m_index.insert(m_entries[i].key, i);
	}

	size_t Map::findEntry(const Value& key) const
	{
		if (m_index.count() == 0)
		{
			for (size_t i = 0; i < m_entries.count(); ++i)
				if (m_entries[i].key == key)
					return i;
			return SIZE_MAX;
		}

		auto it = m_index.lookup(key);
		if (it == m_index.end())
			return SIZE_MAX;
		return it->value;
	}

	bool Map::insert(Value key, Value value)
	{
		auto index = findEntry(key);
		if (index != SIZE_MAX)
		{
			m_entries[index].value = std::move(value);
			return false;
		}

		m_entries.push(Entry{std::move(key), std::move(value)});

		if (m_index.count() > 0)
			m_index.insert(m_entries[m_entries.count() - 1].key, m_entries.count() - 1);
		else if (m_entries.count() > INDEX_THRESHOLD)
			rebuildIndex();
		return true;
	}

	Value* Map::lookup(const Value& key)
	{
		auto index = findEntry(key);
		if (index == SIZE_MAX)
			return nullptr;
		return &m_entries[index].value;
	}

	const Value* Map::lookup(const Value& key) const
	{
		auto index = findEntry(key);
		if (index == SIZE_MAX)
			return nullptr;
		return &m_entries[index].value;
	}

	const Value* Map::lookup(StringView key) const
	{
		if (m_index.count() > 0)
			return lookup(Value::string(key, allocator()));

		for (const auto& entry: m_entries)
			if (entry.key.kind() == Value::KIND_STRING && entry.key.as_string() == key)
				return &entry.value;
		return nullptr;
	}

	void Map::clear()
	{
		m_entries.clear();
		m_index.clear();
	}

	bool Map::operator==(const Map& other) const
	{
		if (m_entries.count() != other.m_entries.count())
			return false;

		for (size_t i = 0; i < m_entries.count(); ++i)
		{
			if (m_entries[i].key != other.m_entries[i].key)
				return false;
			if (m_entries[i].value != other.m_entries[i].value)
				return false;
		}
		return true;
	}

	Value Object::element(size_t index, Allocator* allocator) const
	{
		(void)index;
		(void)allocator;
		return Value{};
	}

	Value Object::property(StringView key, Allocator* allocator) const
	{
		(void)key;
		(void)allocator;
		return Value{};
	}
}
