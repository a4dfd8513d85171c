#include <doctest/doctest.h>

#include <wirepack/Log.h>
#include <wirepack/Mallocator.h>

#include <spdlog/sinks/ostream_sink.h>

#include <sstream>

TEST_CASE("wirepack::Log basics")
{
	wirepack::Mallocator allocator;

	std::ostringstream stream;
	auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(stream);
	wirepack::Log log{wirepack::shared_from<spdlog::logger>(&allocator, std::string{"test"}, sink)};
	log.setPattern("[%l] %v"_sv);
	log.setLevel(wirepack::Log::level::debug);

	log.trace("hidden {}"_sv, 0);
	log.debug("decoded {} bytes"_sv, 12);
	log.warn("value {} has no codec"_sv, "x"_sv);

	auto text = stream.str();
	REQUIRE(text.find("hidden") == std::string::npos);
	REQUIRE(text.find("[debug] decoded 12 bytes") != std::string::npos);
	REQUIRE(text.find("[warning] value x has no codec") != std::string::npos);
	REQUIRE(log.allocator() == &allocator);
}

TEST_CASE("wirepack::Log default construction")
{
	wirepack::Mallocator allocator;

	wirepack::Log log{&allocator, "wirepack-test"_sv};
	REQUIRE(log.logger() != nullptr);
	REQUIRE(log.logger()->name() == "wirepack-test");
	log.setLevel(wirepack::Log::level::off);
	log.info("nothing is printed"_sv);
}
