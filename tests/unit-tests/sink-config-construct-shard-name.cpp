#include "sink.config.hh"
#include "unit.test.macros.hh"

using shardsink::construct_shard_name;

int
main()
{
    int retval = 1;

    try {
        EXPECT_STR_EQ(construct_shard_name("out", "-SSSS-of-NNNN", ".txt", 0, 3),
                      "out-0000-of-0003.txt");
        EXPECT_STR_EQ(construct_shard_name("out", "-SSSS-of-NNNN", ".txt", 2, 3),
                      "out-0002-of-0003.txt");
        EXPECT_STR_EQ(construct_shard_name(
                        "s3://bucket/out", "-SSSS-of-NNNN", "", 41, 100),
                      "s3://bucket/out-0041-of-0100");

        // numbers wider than the run are not truncated
        EXPECT_STR_EQ(construct_shard_name("out", "-SS-of-NN", "", 123, 456),
                      "out-123-of-456");

        // single-character runs, other characters copied verbatim
        EXPECT_STR_EQ(construct_shard_name("out", "_S_N_x", ".gz", 7, 9),
                      "out_7_9_x.gz");

        EXPECT_STR_EQ(construct_shard_name("out",
                                           shardsink::kShardNameTemplateNone,
                                           ".txt",
                                           0,
                                           1),
                      "out.txt");
        EXPECT_STR_EQ(
          construct_shard_name("out",
                               shardsink::kShardNameTemplateDirectoryContainer,
                               "",
                               5,
                               10),
          "out/part-0005");

        // distinct names for every index of every total
        for (size_t total = 1; total <= 20; ++total) {
            for (size_t i = 1; i < total; ++i) {
                CHECK(construct_shard_name("out", "-SSSS-of-NNNN", "", i, total) !=
                      construct_shard_name(
                        "out", "-SSSS-of-NNNN", "", i - 1, total));
            }
        }

        retval = 0;
    } catch (const std::exception& e) {
        LOG_ERROR("Caught exception: ", e.what());
    }

    return retval;
}
