#pragma once

#include <string>
#include "pve/pve_rest_client.hpp"
#include "pve/pve_types.hpp"

// Asks a node to fetch a file from a URL into one of its storages.
// The download runs server side; the returned item is the task handle the
// server answered with, completion is not tracked.
class ContentUploader {
public:
    explicit ContentUploader(PveRestClient& client);

    ContentItem addContent(const std::string& node, const std::string& storage, ContentKind kind,
                           const std::string& fileName, const std::string& sourceUrl);

    // Accepts the wire names "iso", "vztmpl" and "import"; throws
    // ValidationError for anything else before sending a request.
    ContentItem addContent(const std::string& node, const std::string& storage, const std::string& kind,
                           const std::string& fileName, const std::string& sourceUrl);

    static ContentKind parseContentKind(const std::string& kind);
    static std::string contentKindToString(ContentKind kind);

private:
    PveRestClient& client_;
};
