#include "PairListReader.hpp"
#include <shared/utils/Logger.hpp>

namespace ContrastAudit::Internal::IO {

PairListReader::PairListReader(Types::PairRole defaultRole) : defaultRole_(defaultRole) {}

bool PairListReader::loadFromFile(const std::string& filename,
                                  std::vector<Analysis::PairRequest>& pairs) const {
    try {
        cv::FileStorage fs(filename, cv::FileStorage::READ);
        if (!fs.isOpened()) {
            LOG_ERROR("Cannot open pair list for reading: ", filename);
            return false;
        }
        return readPairs(fs, filename, pairs);

    } catch (const cv::Exception& e) {
        LOG_ERROR("OpenCV error while reading pair list ", filename, ": ", e.what());
        return false;
    }
}

bool PairListReader::loadFromString(const std::string& document,
                                    std::vector<Analysis::PairRequest>& pairs) const {
    try {
        cv::FileStorage fs(document, cv::FileStorage::READ | cv::FileStorage::MEMORY);
        if (!fs.isOpened()) {
            LOG_ERROR("Cannot parse pair list document");
            return false;
        }
        return readPairs(fs, "<string>", pairs);

    } catch (const cv::Exception& e) {
        LOG_ERROR("OpenCV error while parsing pair list: ", e.what());
        return false;
    }
}

bool PairListReader::readPairs(const cv::FileStorage& fs, const std::string& source,
                               std::vector<Analysis::PairRequest>& pairs) const {
    cv::FileNode pairsNode = fs["pairs"];
    if (!pairsNode.isSeq()) {
        LOG_ERROR("Pair list ", source, " has no 'pairs' sequence");
        return false;
    }

    int index = 0;
    for (auto it = pairsNode.begin(); it != pairsNode.end(); ++it, ++index) {
        cv::FileNode entry = *it;
        if (!entry.isMap()) {
            LOG_WARN("Skipping pair #", index, " in ", source, ": not a map");
            continue;
        }

        Analysis::PairRequest request;
        request.role = defaultRole_;
        request.foreground = readString(entry, "foreground", "fg");
        request.background = readString(entry, "background", "bg");
        request.label = readString(entry, "label", nullptr);

        if (request.foreground.empty() || request.background.empty()) {
            LOG_WARN("Skipping pair #", index, " in ", source, ": missing color");
            continue;
        }

        std::string role = readString(entry, "role", nullptr);
        if (!role.empty() && !Types::parsePairRole(role, request.role)) {
            LOG_WARN("Unknown role '", role, "' for pair #", index, "; using ",
                     Types::toString(defaultRole_));
        }

        if (request.label.empty()) {
            request.label = source + "#" + std::to_string(index);
        }
        pairs.push_back(request);
    }

    LOG_DEBUG("Read ", pairs.size(), " pair(s) from ", source);
    return true;
}

std::string PairListReader::readString(const cv::FileNode& entry, const char* key,
                                       const char* shortKey) {
    cv::FileNode node = entry[key];
    if ((node.empty() || node.isNone()) && shortKey) {
        node = entry[shortKey];
    }
    if (node.isString()) {
        return static_cast<std::string>(node);
    }
    return std::string();
}

}  // namespace ContrastAudit::Internal::IO
