#pragma once

#include "wirepack/Exports.h"
#include "wirepack/Allocator.h"
#include "wirepack/Array.h"
#include "wirepack/Buffer.h"
#include "wirepack/Hash.h"
#include "wirepack/String.h"
#include "wirepack/Shared.h"
#include "wirepack/msgpack/Ext.h"

#include <fmt/core.h>
#include <fmt/format.h>

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <type_traits>

namespace wirepack::msgpack
{
	class Map;
	class Object;

	class Value
	{
	public:
		enum KIND
		{
			KIND_NIL,
			KIND_BOOL,
			KIND_INT,
			KIND_UINT,
			KIND_FLOAT,
			KIND_DOUBLE,
			KIND_STRING,
			KIND_BYTES,
			KIND_ARRAY,
			KIND_MAP,
			KIND_EXT,
			KIND_OBJECT,
		};

		Value() = default;
		Value(std::nullptr_t) {}
		Value(bool value) : m_kind{KIND_BOOL}, m_bool{value} {}

		template<std::integral T>
		requires (std::is_same_v<T, bool> == false && std::is_signed_v<T>)
		Value(T value) : m_kind{KIND_INT}, m_int{int64_t(value)} {}

		template<std::integral T>
		requires (std::is_same_v<T, bool> == false && std::is_unsigned_v<T>)
		Value(T value) : m_kind{KIND_UINT}, m_uint{uint64_t(value)} {}

		Value(float value) : m_kind{KIND_FLOAT}, m_float{value} {}
		Value(double value) : m_kind{KIND_DOUBLE}, m_double{value} {}
		// string literals would otherwise silently become booleans
		Value(const char*) = delete;

		WIREPACK_EXPORT Value(String value);
		WIREPACK_EXPORT Value(Buffer value);
		WIREPACK_EXPORT Value(Array<Value> value);
		WIREPACK_EXPORT Value(Map value);
		WIREPACK_EXPORT Value(Ext value);
		WIREPACK_EXPORT Value(Shared<Object> value);

		template<typename T>
		requires (std::is_base_of_v<Object, T> && std::is_same_v<T, Object> == false)
		Value(Shared<T> value) : Value(Shared<Object>{std::move(value)}) {}

		static Value string(StringView value, Allocator* allocator) { return Value{String{value, allocator}}; }
		static Value bytes(Span<const std::byte> value, Allocator* allocator) { return Value{Buffer{value, allocator}}; }

		Value(const Value& other)
		{
			copyFrom(other);
		}

		Value(Value&& other) noexcept
		{
			moveFrom(std::move(other));
		}

		// other may live inside this value, so it's taken out before this value is destroyed
		Value& operator=(const Value& other)
		{
			if (this == &other)
				return *this;
			Value tmp{other};
			destroy();
			moveFrom(std::move(tmp));
			return *this;
		}

		Value& operator=(Value&& other) noexcept
		{
			if (this == &other)
				return *this;
			Value tmp{std::move(other)};
			destroy();
			moveFrom(std::move(tmp));
			return *this;
		}

		~Value()
		{
			destroy();
		}

		KIND kind() const { return m_kind; }
		// allocator owning the heap part of string, bytes, array, map, ext and object values
		Allocator* allocator() const { return m_allocator; }

		bool is_nil() const { return m_kind == KIND_NIL; }
		bool is_number() const
		{
			return m_kind == KIND_INT || m_kind == KIND_UINT || m_kind == KIND_FLOAT || m_kind == KIND_DOUBLE;
		}

		bool as_bool() const { validate(m_kind == KIND_BOOL); return m_bool; }
		int64_t as_int() const { validate(m_kind == KIND_INT); return m_int; }
		uint64_t as_uint() const { validate(m_kind == KIND_UINT); return m_uint; }
		float as_float() const { validate(m_kind == KIND_FLOAT); return m_float; }
		double as_double() const { validate(m_kind == KIND_DOUBLE); return m_double; }

		String& as_string() { validate(m_kind == KIND_STRING); return *m_string; }
		const String& as_string() const { validate(m_kind == KIND_STRING); return *m_string; }

		Buffer& as_bytes() { validate(m_kind == KIND_BYTES); return *m_bytes; }
		const Buffer& as_bytes() const { validate(m_kind == KIND_BYTES); return *m_bytes; }

		Array<Value>& as_array() { validate(m_kind == KIND_ARRAY); return *m_array; }
		const Array<Value>& as_array() const { validate(m_kind == KIND_ARRAY); return *m_array; }

		Map& as_map() { validate(m_kind == KIND_MAP); return *m_map; }
		const Map& as_map() const { validate(m_kind == KIND_MAP); return *m_map; }

		const Ext& as_ext() const { validate(m_kind == KIND_EXT); return *m_ext; }

		const Shared<Object>& as_object() const { validate(m_kind == KIND_OBJECT); return *m_object; }

		// numeric value widened to double, only valid for number kinds
		WIREPACK_EXPORT double to_double() const;

		WIREPACK_EXPORT bool operator==(const Value& other) const;
		bool operator!=(const Value& other) const { return !operator==(other); }

		WIREPACK_EXPORT size_t hash(size_t seed) const;

	private:
		WIREPACK_EXPORT void destroy();
		WIREPACK_EXPORT void copyFrom(const Value& other);
		WIREPACK_EXPORT void moveFrom(Value&& other);

		KIND m_kind = KIND_NIL;
		Allocator* m_allocator = nullptr;
		union
		{
			bool m_bool;
			int64_t m_int;
			uint64_t m_uint;
			float m_float;
			double m_double;
			String* m_string;
			Buffer* m_bytes;
			Array<Value>* m_array;
			Map* m_map;
			Ext* m_ext;
			Shared<Object>* m_object;
		};
	};

	WIREPACK_EXPORT StringView kindName(Value::KIND kind);
}

namespace wirepack
{
	template<>
	struct Hash<msgpack::Value>
	{
		inline size_t operator()(const msgpack::Value& value, size_t seed) const
		{
			return value.hash(seed);
		}
	};
}

namespace wirepack::msgpack
{

	// insertion ordered map with unique keys, any value can be a key
	class Map
	{
	public:
		struct Entry
		{
			Value key;
			Value value;
		};

	private:
		// maps above this many entries keep a key index, smaller ones are scanned
		static constexpr size_t INDEX_THRESHOLD = 16;

		Array<Entry> m_entries;
		// key to position in m_entries
		wirepack::Map<Value, size_t> m_index;

		void rebuildIndex();
		size_t findEntry(const Value& key) const;

	public:
		explicit Map(Allocator* allocator)
			: m_entries(allocator),
			  m_index(allocator)
		{}

		Allocator* allocator() const { return m_entries.allocator(); }
		size_t count() const { return m_entries.count(); }

		const Entry& operator[](size_t i) const { return m_entries[i]; }

		// inserts key or replaces the value of an equal key in place, returns true when the key is new
		WIREPACK_EXPORT bool insert(Value key, Value value);
		WIREPACK_EXPORT Value* lookup(const Value& key);
		WIREPACK_EXPORT const Value* lookup(const Value& key) const;
		WIREPACK_EXPORT const Value* lookup(StringView key) const;

		void reserve(size_t added_count) { m_entries.reserve(added_count); }
		WIREPACK_EXPORT void clear();

		const Entry* begin() const { return m_entries.begin(); }
		const Entry* end() const { return m_entries.end(); }

		WIREPACK_EXPORT bool operator==(const Map& other) const;
		bool operator!=(const Map& other) const { return !operator==(other); }
	};

	// application value that has no direct msgpack shape, the encoder classifies it through this interface
	class Object
	{
	public:
		virtual ~Object() = default;

		virtual StringView typeName() const = 0;

		// callables carry no encodable state and go to the unsupported value handler
		virtual bool isCallable() const { return false; }

		// sequence like objects are encoded as arrays of their elements
		virtual bool isSequence() const { return false; }
		virtual size_t count() const { return 0; }
		WIREPACK_EXPORT virtual Value element(size_t index, Allocator* allocator) const;

		// own enumerable property names in insertion order
		virtual void keys(Array<String>& out) const { (void)out; }
		WIREPACK_EXPORT virtual Value property(StringView key, Allocator* allocator) const;
	};
}

namespace fmt
{
	template<>
	struct formatter<wirepack::msgpack::Value>
	{
		template<typename ParseContext>
		constexpr auto parse(ParseContext& ctx)
		{
			return ctx.begin();
		}

		template<typename FormatContext>
		auto format(const wirepack::msgpack::Value& value, FormatContext& ctx) const
		{
			auto out = ctx.out();
			formatValue(out, value);
			return out;
		}

	private:
		template<typename OutputIt>
		static void formatValue(OutputIt& out, const wirepack::msgpack::Value& value)
		{
			using wirepack::msgpack::Value;
			switch (value.kind())
			{
			case Value::KIND_NIL:
				out = fmt::format_to(out, "null");
				break;
			case Value::KIND_BOOL:
				out = fmt::format_to(out, "{}", value.as_bool());
				break;
			case Value::KIND_INT:
				out = fmt::format_to(out, "{}", value.as_int());
				break;
			case Value::KIND_UINT:
				out = fmt::format_to(out, "{}", value.as_uint());
				break;
			case Value::KIND_FLOAT:
				out = fmt::format_to(out, "{}", value.as_float());
				break;
			case Value::KIND_DOUBLE:
				out = fmt::format_to(out, "{}", value.as_double());
				break;
			case Value::KIND_STRING:
				out = fmt::format_to(out, "\"{}\"", value.as_string());
				break;
			case Value::KIND_BYTES:
			{
				out = fmt::format_to(out, "<bytes");
				for (auto b: wirepack::Span<const std::byte>{value.as_bytes()})
					out = fmt::format_to(out, " {:02x}", uint8_t(b));
				out = fmt::format_to(out, ">");
				break;
			}
			case Value::KIND_ARRAY:
			{
				out = fmt::format_to(out, "[");
				bool first = true;
				for (const auto& element: value.as_array())
				{
					if (first == false)
						out = fmt::format_to(out, ", ");
					formatValue(out, element);
					first = false;
				}
				out = fmt::format_to(out, "]");
				break;
			}
			case Value::KIND_MAP:
			{
				out = fmt::format_to(out, "{{");
				bool first = true;
				for (const auto& entry: value.as_map())
				{
					if (first == false)
						out = fmt::format_to(out, ", ");
					formatValue(out, entry.key);
					out = fmt::format_to(out, ": ");
					formatValue(out, entry.value);
					first = false;
				}
				out = fmt::format_to(out, "}}");
				break;
			}
			case Value::KIND_EXT:
			{
				const auto& ext = value.as_ext();
				out = fmt::format_to(out, "<ext {}", ext.type());
				for (auto b: ext.bytes())
					out = fmt::format_to(out, " {:02x}", uint8_t(b));
				out = fmt::format_to(out, ">");
				break;
			}
			case Value::KIND_OBJECT:
				out = fmt::format_to(out, "<{}>", value.as_object()->typeName());
				break;
			default:
				wirepack::unreachable();
				break;
			}
		}
	};
}
