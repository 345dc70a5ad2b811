#include "bundle.writer.hh"
#include "unit.test.macros.hh"

using namespace shardsink;

namespace {
class CountingChannel : public WritableChannel
{
  public:
    CountingChannel(size_t& n_closed, bool flush_succeeds)
      : n_closed_(n_closed)
      , flush_succeeds_(flush_succeeds)
    {
    }

    bool write(ConstByteSpan) override { return true; }

  protected:
    bool flush_() override
    {
        ++n_closed_;
        return flush_succeeds_;
    }

  private:
    size_t& n_closed_;
    bool flush_succeeds_;
};

class CountingFilesystem : public Filesystem
{
  public:
    CountingFilesystem(size_t& n_closed, bool flush_succeeds)
      : n_closed_(n_closed)
      , flush_succeeds_(flush_succeeds)
    {
    }

    std::unique_ptr<WritableChannel> create(std::string_view,
                                            std::string_view) override
    {
        return std::make_unique<CountingChannel>(n_closed_, flush_succeeds_);
    }

    std::vector<std::string> match(std::string_view) override { return {}; }

  private:
    size_t& n_closed_;
    bool flush_succeeds_;
};

class BrokenFooterFormat : public FormatWriter
{
  public:
    void prepare_write(WritableChannel&) override {}
    void write_value(ConstByteSpan) override {}
    void write_footer() override
    {
        throw std::runtime_error("footer rejected");
    }
};

class PlainFormat : public FormatWriter
{
  public:
    void prepare_write(WritableChannel&) override {}
    void write_value(ConstByteSpan) override {}
};
} // namespace

int
main()
{
    int retval = 1;

    try {
        const std::byte record[] = { std::byte{ 'x' } };

        // footer failure: channel is still released, error propagates
        {
            size_t n_closed = 0;
            BundleWriter writer(
              "out/data",
              std::make_shared<CountingFilesystem>(n_closed, true),
              std::make_unique<BrokenFooterFormat>());
            writer.open("c");
            writer.write(record);

            std::string what;
            try {
                (void)writer.close();
            } catch (const std::runtime_error& exc) {
                what = exc.what();
            }
            EXPECT_STR_EQ(what, "footer rejected");
            EXPECT_EQ(size_t, n_closed, 1);
            CHECK(writer.state() == BundleWriter::State::Failed);

            EXPECT_THROWS(std::runtime_error, (void)writer.close());
            EXPECT_EQ(size_t, n_closed, 1);
        }

        // flush failure on close is an error
        {
            size_t n_closed = 0;
            BundleWriter writer(
              "out/data",
              std::make_shared<CountingFilesystem>(n_closed, false),
              std::make_unique<PlainFormat>());
            writer.open("d");
            writer.write(record);

            EXPECT_THROWS(std::runtime_error, (void)writer.close());
            EXPECT_EQ(size_t, n_closed, 1);
            CHECK(writer.state() == BundleWriter::State::Failed);
        }

        retval = 0;
    } catch (const std::exception& e) {
        LOG_ERROR("Caught exception: ", e.what());
    }

    return retval;
}
