#include <wirepack/Mallocator.h>
#include <wirepack/Log.h>
#include <wirepack/Msgpack.h>

#include <fmt/core.h>

#include <cstdlib>

using namespace wirepack::msgpack;

auto HELP = R"""(wirepack-playground msgpack encoder and decoder playground
wirepack-playground encode
  encodes a sample document and prints its bytes
wirepack-playground decode HEX
  decodes a hex string like "82a16101a162c3" and prints the value
)"""_sv;

inline static int hexDigit(char c)
{
	if (c >= '0' && c <= '9')
		return c - '0';
	if (c >= 'a' && c <= 'f')
		return c - 'a' + 10;
	if (c >= 'A' && c <= 'F')
		return c - 'A' + 10;
	return -1;
}

inline static bool parseHex(wirepack::StringView text, wirepack::Buffer& out)
{
	if (text.count() % 2 != 0)
		return false;

	for (size_t i = 0; i < text.count(); i += 2)
	{
		auto high = hexDigit(text[i]);
		auto low = hexDigit(text[i + 1]);
		if (high < 0 || low < 0)
			return false;
		out.push(uint8_t(high << 4 | low));
	}
	return true;
}

inline static Value sampleDocument(wirepack::Allocator* allocator)
{
	wirepack::Array<Value> tags{allocator};
	tags.push(Value::string("codec"_sv, allocator));
	tags.push(Value::string("binary"_sv, allocator));

	Map document{allocator};
	document.insert(Value::string("name"_sv, allocator), Value::string("wirepack"_sv, allocator));
	document.insert(Value::string("version"_sv, allocator), Value{1});
	document.insert(Value::string("ratio"_sv, allocator), Value{0.5});
	document.insert(Value::string("tags"_sv, allocator), Value{std::move(tags)});
	document.insert(Value::string("missing"_sv, allocator), undefined(allocator));
	return Value{std::move(document)};
}

int main(int argc, char** argv)
{
	wirepack::Mallocator allocator;
	wirepack::Log log{&allocator, "playground"_sv};

	if (argc < 2)
	{
		fmt::print("{}", HELP);
		return EXIT_FAILURE;
	}

	CodecRegistry codecs{&allocator};
	if (auto err = codecs.emplace<UndefinedCodec>())
	{
		log.critical("failed to register the undefined codec, {}"_sv, err);
		return EXIT_FAILURE;
	}

	auto mode = wirepack::StringView{argv[1]};
	if (mode == "encode"_sv)
	{
		EncoderConfig config{};
		config.codecs = &codecs;
		config.log = &log;
		Encoder encoder{std::move(config), &allocator};

		auto value = sampleDocument(&allocator);
		auto res = encoder.encode(value);
		if (res.isError())
		{
			log.error("{}"_sv, res.error());
			return EXIT_FAILURE;
		}

		log.info("{} encodes to {} bytes"_sv, value, res.value().count());
		for (auto b: wirepack::Span<const std::byte>{res.value()})
			fmt::print("{:02x}", uint8_t(b));
		fmt::print("\n");
		return EXIT_SUCCESS;
	}
	else if (mode == "decode"_sv && argc == 3)
	{
		wirepack::Buffer bytes{&allocator};
		if (parseHex(wirepack::StringView{argv[2]}, bytes) == false)
		{
			log.error("'{}' is not a hex string"_sv, wirepack::StringView{argv[2]});
			return EXIT_FAILURE;
		}

		DecoderConfig config{};
		config.codecs = &codecs;
		config.log = &log;
		Decoder decoder{config, &allocator};

		auto res = decoder.decode(bytes);
		if (res.isError())
		{
			log.error("{}"_sv, res.error());
			return EXIT_FAILURE;
		}

		fmt::print("{}\n", res.value());
		return EXIT_SUCCESS;
	}
	else
	{
		fmt::print("{}", HELP);
		return EXIT_FAILURE;
	}
}
