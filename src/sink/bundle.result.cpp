#include "bundle.result.hh"
#include "macros.hh"

void
shardsink::to_json(nlohmann::json& json, const BundleResult& result)
{
    json = nlohmann::json{ { "filename", result.filename } };
}

void
shardsink::from_json(const nlohmann::json& json, BundleResult& result)
{
    json.at("filename").get_to(result.filename);
}

std::string_view
shardsink::BundleResultCoder::type_name() const
{
    return "shardsink.BundleResult";
}

std::string
shardsink::BundleResultCoder::encode(const BundleResult& result) const
{
    nlohmann::json json = result;
    return json.dump();
}

shardsink::BundleResult
shardsink::BundleResultCoder::decode(std::string_view encoded) const
{
    try {
        return nlohmann::json::parse(encoded).get<BundleResult>();
    } catch (const nlohmann::json::exception& exc) {
        const std::string err = LOG_ERROR(
          "Failed to decode bundle result '", encoded, "': ", exc.what());
        throw std::runtime_error(err);
    }
}
