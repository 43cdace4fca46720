#pragma once

#include "../analysis/BatchProcessor.hpp"
#include <opencv2/core.hpp>
#include <string>
#include <vector>

namespace ContrastAudit::Internal::IO {

// Reads a YAML/JSON document with a `pairs` sequence:
//   pairs:
//     - { foreground: "#333", background: "#fff", role: text, label: "app.css:12" }
// `fg`/`bg` are accepted as short keys. Entries without a role get the default role.
class PairListReader {
  public:
    explicit PairListReader(Types::PairRole defaultRole = Types::PairRole::TEXT);

    bool loadFromFile(const std::string& filename, std::vector<Analysis::PairRequest>& pairs) const;

    bool loadFromString(const std::string& document,
                        std::vector<Analysis::PairRequest>& pairs) const;

  private:
    Types::PairRole defaultRole_;

    bool readPairs(const cv::FileStorage& fs, const std::string& source,
                   std::vector<Analysis::PairRequest>& pairs) const;

    static std::string readString(const cv::FileNode& entry, const char* key, const char* shortKey);
};

}  // namespace ContrastAudit::Internal::IO
