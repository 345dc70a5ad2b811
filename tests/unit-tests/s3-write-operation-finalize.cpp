#include "text.format.hh"
#include "unit.test.macros.hh"
#include "write.operation.hh"

#include <cstdlib>

using namespace shardsink;

namespace {
bool
get_bucket_name(std::string& bucket_name)
{
    const char* env = std::getenv("SHARDSINK_S3_BUCKET_NAME");
    if (env == nullptr) {
        LOG_ERROR("SHARDSINK_S3_BUCKET_NAME not set.");
        return false;
    }
    bucket_name = env;

    return true;
}

BundleResult
write_bundle(const WriteOperation& operation,
             std::string_view attempt_id,
             const std::string& record)
{
    auto writer = operation.create_writer();
    writer->open(attempt_id);
    writer->write(
      { reinterpret_cast<const std::byte*>(record.data()), record.size() });
    return writer->close();
}
} // namespace

int
main()
{
    auto s3_settings = s3_settings_from_environment();
    std::string bucket_name;
    if (!s3_settings || !get_bucket_name(bucket_name)) {
        LOG_WARNING("Failed to get credentials. Skipping test.");
        return 0;
    }

    int retval = 1;
    const std::string prefix = std::string(TEST) + "/";
    const std::string base = make_s3_uri({ bucket_name, prefix + "out" });

    try {
        StorageSettings settings;
        settings.n_threads = 2;
        settings.max_requests_per_batch = 2; // force several batches
        settings.s3 = s3_settings;
        auto filesystems = std::make_shared<FilesystemFactory>(settings);

        auto pool = std::make_shared<S3ConnectionPool>(
          1,
          s3_settings->endpoint,
          s3_settings->access_key_id,
          s3_settings->secret_access_key);

        auto conn = pool->get_connection();
        CHECK(conn);
        if (!conn->is_connection_valid()) {
            LOG_ERROR("Failed to connect to S3.");
            return 1;
        }
        CHECK(conn->bucket_exists(bucket_name));

        // clear leftovers from an earlier run
        for (const auto& key : conn->list_objects(bucket_name, prefix)) {
            CHECK(conn->delete_object(bucket_name, key).ok());
        }

        WriteOperation operation(
          SinkConfig(base, "txt"), make_text_format(), filesystems);

        std::vector<BundleResult> results;
        for (const auto* id : { "c", "a", "e", "b", "d" }) {
            results.push_back(write_bundle(operation, id, id));
        }
        // an abandoned attempt
        {
            auto writer = operation.create_writer();
            writer->open("z");
            (void)writer->close();
        }

        operation.finalize(results);

        auto s3 = filesystems->make_filesystem(base);
        CHECK(s3->match(base + "-temp-*").empty());

        const auto outputs = s3->match(base + "-*-of-0005.txt");
        EXPECT_EQ(size_t, outputs.size(), 5);
        EXPECT_STR_EQ(outputs.front(), base + "-0000-of-0005.txt");
        EXPECT_STR_EQ(outputs.back(), base + "-0004-of-0005.txt");

        // retrying is harmless
        operation.finalize(results);
        EXPECT_EQ(size_t, s3->match(base + "-*").size(), 5);

        // missing sources and targets are skipped
        auto operations = filesystems->make_file_operations(base);
        operations->copy({ base + "-missing" }, { base + "-copy" });
        CHECK(!conn->object_exists(bucket_name, prefix + "out-copy"));
        operations->remove({ base + "-missing" });

        operations->remove(outputs);
        CHECK(s3->match(base + "*").empty());

        pool->return_connection(std::move(conn));

        retval = 0;
    } catch (const std::exception& e) {
        LOG_ERROR("Caught exception: ", e.what());
    }

    return retval;
}
