#include "bundle.writer.hh"
#include "macros.hh"

std::string
shardsink::build_temporary_filename(std::string_view prefix,
                                    std::string_view suffix)
{
    std::string filename(prefix);
    filename += kTemporaryFilenameSeparator;
    filename += suffix;
    return filename;
}

const char*
shardsink::bundle_writer_state_to_string(BundleWriter::State state)
{
    switch (state) {
        case BundleWriter::State::Created:
            return "created";
        case BundleWriter::State::Open:
            return "open";
        case BundleWriter::State::HeaderWritten:
            return "header written";
        case BundleWriter::State::Writing:
            return "writing";
        case BundleWriter::State::FooterWritten:
            return "footer written";
        case BundleWriter::State::Closed:
            return "closed";
        case BundleWriter::State::Failed:
            return "failed";
        default:
            return "(unknown)";
    }
}

shardsink::BundleWriter::BundleWriter(std::string_view base_temporary_filename,
                                      std::shared_ptr<Filesystem> filesystem,
                                      std::unique_ptr<FormatWriter> format)
  : base_temporary_filename_(base_temporary_filename)
  , filesystem_(filesystem)
  , format_(std::move(format))
{
    EXPECT(!base_temporary_filename_.empty(),
           "Base temporary filename must not be empty.");
    EXPECT(filesystem_, "Filesystem not provided.");
    EXPECT(format_, "Format writer not provided.");
}

shardsink::BundleWriter::~BundleWriter()
{
    if (channel_) {
        LOG_WARNING("Abandoning unclosed bundle file ", filename_);
    }
}

void
shardsink::BundleWriter::open(std::string_view attempt_id)
{
    EXPECT(state_ == State::Created,
           "Cannot open a writer in state '",
           bundle_writer_state_to_string(state_),
           "'.");

    attempt_id_ = attempt_id;
    filename_ = build_temporary_filename(base_temporary_filename_, attempt_id);

    LOG_DEBUG("Opening ", filename_);
    try {
        channel_ = filesystem_->create(filename_, mime_type());
    } catch (...) {
        state_ = State::Failed;
        throw;
    }
    state_ = State::Open;

    try {
        format_->prepare_write(*channel_);
        LOG_DEBUG("Writing header to ", filename_);
        format_->write_header();
    } catch (...) {
        // the caller does not close a writer that failed to open
        LOG_ERROR("Writing header to ", filename_, " failed, closing channel.");
        state_ = State::Failed;
        release_channel_quietly_(std::move(channel_));
        throw;
    }

    state_ = State::HeaderWritten;
    LOG_DEBUG("Starting write of bundle ", attempt_id_, " to ", filename_);
}

void
shardsink::BundleWriter::write(ConstByteSpan record)
{
    EXPECT(state_ == State::HeaderWritten || state_ == State::Writing,
           "Cannot write to a writer in state '",
           bundle_writer_state_to_string(state_),
           "'.");

    try {
        format_->write_value(record);
    } catch (...) {
        state_ = State::Failed;
        throw;
    }

    state_ = State::Writing;
}

shardsink::BundleResult
shardsink::BundleWriter::close()
{
    EXPECT(state_ == State::HeaderWritten || state_ == State::Writing,
           "Cannot close a writer in state '",
           bundle_writer_state_to_string(state_),
           "'; was open() called?");

    auto channel = std::move(channel_);
    try {
        LOG_DEBUG("Writing footer to ", filename_);
        format_->write_footer();
    } catch (...) {
        state_ = State::Failed;
        release_channel_quietly_(std::move(channel));
        throw;
    }
    state_ = State::FooterWritten;

    const bool flushed = finalize_channel(std::move(channel));
    if (!flushed) {
        state_ = State::Failed;
    }
    EXPECT(flushed, "Failed to close ", filename_);

    state_ = State::Closed;
    LOG_DEBUG("Result for bundle ", attempt_id_, ": ", filename_);

    return { filename_ };
}

shardsink::BundleWriter::State
shardsink::BundleWriter::state() const
{
    return state_;
}

const std::string&
shardsink::BundleWriter::filename() const
{
    return filename_;
}

std::string_view
shardsink::BundleWriter::mime_type() const
{
    return format_->mime_type();
}

void
shardsink::BundleWriter::release_channel_quietly_(
  std::unique_ptr<WritableChannel> channel)
{
    try {
        if (!finalize_channel(std::move(channel))) {
            LOG_ERROR("Closing channel for ", filename_, " failed.");
        }
    } catch (const std::exception& exc) {
        // the original error takes precedence
        LOG_ERROR("Closing channel for ", filename_, " failed: ", exc.what());
    }
}
