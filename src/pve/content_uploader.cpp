#include "pve/content_uploader.hpp"
#include "common/logger.hpp"
#include "common/pve_errors.hpp"
#include "common/utils.hpp"

ContentUploader::ContentUploader(PveRestClient& client)
    : client_(client) {
}

ContentKind ContentUploader::parseContentKind(const std::string& kind) {
    if (kind == "iso") {
        return ContentKind::Iso;
    } else if (kind == "vztmpl") {
        return ContentKind::Template;
    } else if (kind == "import") {
        return ContentKind::Import;
    }
    throw ValidationError("contentKind", kind, "expected one of iso, vztmpl, import");
}

std::string ContentUploader::contentKindToString(ContentKind kind) {
    switch (kind) {
        case ContentKind::Iso:      return "iso";
        case ContentKind::Template: return "vztmpl";
        case ContentKind::Import:   return "import";
    }
    throw ValidationError("contentKind", std::to_string(static_cast<int>(kind)), "unknown content kind");
}

ContentItem ContentUploader::addContent(const std::string& node, const std::string& storage,
                                        const std::string& kind, const std::string& fileName,
                                        const std::string& sourceUrl) {
    return addContent(node, storage, parseContentKind(kind), fileName, sourceUrl);
}

ContentItem ContentUploader::addContent(const std::string& node, const std::string& storage, ContentKind kind,
                                        const std::string& fileName, const std::string& sourceUrl) {
    std::string content = contentKindToString(kind);
    if (fileName.empty()) {
        throw ValidationError("fileName", fileName, "must not be empty");
    }
    if (sourceUrl.empty()) {
        throw ValidationError("sourceUrl", sourceUrl, "must not be empty");
    }

    nlohmann::json body = {
        {"content", content},
        {"filename", fileName},
        {"node", node},
        {"storage", storage},
        {"url", sourceUrl}
    };

    Logger::info("Requesting download of " + sourceUrl + " as " + content + " '" + fileName + "' into " +
                 node + "/" + storage);
    ContentItem result = client_.post("/nodes/" + utils::urlEncode(node) + "/storage/" +
                                      utils::urlEncode(storage) + "/download-url", body);
    Logger::info("Download accepted by " + client_.host() + ": " + result.dump());
    return result;
}
