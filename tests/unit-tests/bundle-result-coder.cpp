#include "bundle.result.hh"
#include "unit.test.macros.hh"

using namespace shardsink;

int
main()
{
    int retval = 1;

    try {
        BundleResultCoder coder;
        EXPECT_STR_EQ(std::string(coder.type_name()), "shardsink.BundleResult");

        const BundleResult result{ "s3://bucket/out/data-temp-3f2a" };
        const auto encoded = coder.encode(result);
        CHECK(nlohmann::json::parse(encoded)["filename"] == result.filename);
        CHECK(coder.decode(encoded) == result);

        // unknown keys are ignored
        CHECK(coder.decode(R"({"filename": "a-temp-1", "extra": 3})") ==
              BundleResult{ "a-temp-1" });

        EXPECT_THROWS(std::runtime_error, coder.decode("not json"));
        EXPECT_THROWS(std::runtime_error, coder.decode(R"({"name": "x"})"));
        EXPECT_THROWS(std::runtime_error, coder.decode(R"({"filename": 5})"));

        retval = 0;
    } catch (const std::exception& e) {
        LOG_ERROR("Caught exception: ", e.what());
    }

    return retval;
}
