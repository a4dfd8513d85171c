#include "wirepack/msgpack/Codec.h"

namespace wirepack::msgpack
{
	Error CodecRegistry::add(Unique<Codec> codec)
	{
		if (codec == nullptr)
			return errf(allocator(), Error::KIND_INVALID_CODEC, "null codec"_sv);

		if (codec->type() < 0)
			return errf(allocator(), Error::KIND_INVALID_CODEC, "codec type {} is reserved, application types are 0..127"_sv, codec->type());

		m_codecs.push(std::move(codec));
		return {};
	}

	Codec* CodecRegistry::findByType(int8_t type) const
	{
		for (const auto& codec: m_codecs)
			if (codec->type() == type)
				return codec.get();
		return nullptr;
	}
}
