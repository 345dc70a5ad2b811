#include "macros.hh"
#include "sink.config.hh"

#include <stdexcept>

namespace {
std::string
zero_pad(size_t value, size_t width)
{
    auto digits = std::to_string(value);
    if (digits.size() < width) {
        digits.insert(0, width - digits.size(), '0');
    }
    return digits;
}
} // namespace

shardsink::SinkConfig::SinkConfig(std::string_view base_output_filename,
                                  std::string_view extension,
                                  std::string_view naming_template)
  : base_output_filename_(base_output_filename)
  , extension_(extension)
  , naming_template_(naming_template)
{
    if (base_output_filename_.empty()) {
        throw std::invalid_argument(
          LOG_ERROR("Base output filename must not be empty."));
    }
}

const std::string&
shardsink::SinkConfig::base_output_filename() const
{
    return base_output_filename_;
}

const std::string&
shardsink::SinkConfig::extension() const
{
    return extension_;
}

const std::string&
shardsink::SinkConfig::naming_template() const
{
    return naming_template_;
}

std::string
shardsink::SinkConfig::file_extension_suffix() const
{
    if (extension_.empty()) {
        return {};
    }

    if (extension_.starts_with('.')) {
        return extension_;
    }

    return "." + extension_;
}

bool
shardsink::SinkConfig::is_sharded() const
{
    return naming_template_.find('S') != std::string::npos;
}

std::string
shardsink::construct_shard_name(std::string_view prefix,
                                std::string_view shard_template,
                                std::string_view suffix,
                                size_t shard_index,
                                size_t n_shards)
{
    std::string name(prefix);

    for (size_t i = 0; i < shard_template.size();) {
        const char c = shard_template[i];
        if (c != 'S' && c != 'N') {
            name.push_back(c);
            ++i;
            continue;
        }

        size_t run = 0;
        while (i + run < shard_template.size() && shard_template[i + run] == c) {
            ++run;
        }

        name += zero_pad(c == 'S' ? shard_index : n_shards, run);
        i += run;
    }

    name += suffix;
    return name;
}
