#pragma once

#include "wirepack/Exports.h"
#include "wirepack/String.h"
#include "wirepack/StringView.h"
#include "wirepack/Result.h"
#include "wirepack/msgpack/Value.h"

#include <fmt/core.h>

#include <utility>

namespace wirepack::msgpack
{
	// codec failure, an empty error converts to false
	class [[nodiscard]] Error
	{
	public:
		enum KIND
		{
			KIND_NONE,
			// value has no encodable representation and neither a codec nor the handler claimed it
			KIND_ENCODING_FAILED,
			// a length prefix demanded more bytes than the input holds
			KIND_TRUNCATED_INPUT,
			// tag byte outside the format space, or structurally malformed input
			KIND_INVALID_FORMAT,
			// codec registered with a type outside the application range
			KIND_INVALID_CODEC,
		};

		Error()
			: m_message(nullptr)
		{}

		Error(KIND kind, String message)
			: m_kind(kind),
			  m_message(std::move(message))
		{}

		Error(String message, Value value)
			: m_kind(KIND_ENCODING_FAILED),
			  m_message(std::move(message)),
			  m_value(std::move(value))
		{}

		KIND kind() const { return m_kind; }
		StringView message() const { return m_message; }

		// offending value of an encoding failure
		const Value& value() const { return m_value; }
		Value::KIND valueKind() const { return m_value.kind(); }

		operator bool() const { return m_kind != KIND_NONE; }

	private:
		KIND m_kind = KIND_NONE;
		String m_message;
		Value m_value;
	};

	WIREPACK_EXPORT StringView errorKindName(Error::KIND kind);

	template<typename ... Args>
	inline Error errf(Allocator* allocator, Error::KIND kind, StringView format, Args&& ... args)
	{
		return Error{kind, strf(allocator, format, std::forward<Args>(args)...)};
	}
}

namespace fmt
{
	template<>
	struct formatter<wirepack::msgpack::Error>
	{
		template<typename ParseContext>
		constexpr auto parse(ParseContext& ctx)
		{
			return ctx.begin();
		}

		template<typename FormatContext>
		auto format(const wirepack::msgpack::Error& err, FormatContext& ctx) const
		{
			return format_to(ctx.out(), "{}: {}", wirepack::msgpack::errorKindName(err.kind()), err.message());
		}
	};
}
