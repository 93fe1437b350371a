#include "upload/helper_params.hpp"
#include "common/errors.hpp"

HelperParams::HelperParams() : doc_(HelperDocument::object()) {
}

void HelperParams::set(const std::string& key, HelperDocument value) {
    doc_[key] = std::move(value);
}

void HelperParams::setStringList(const std::string& key, const std::vector<std::string>& values) {
    HelperDocument list = HelperDocument::array();
    for (const auto& value : values) {
        list.push_back(value);
    }
    doc_[key] = std::move(list);
}

HelperParams HelperParams::with(const std::string& key, HelperDocument value) const {
    HelperParams copy(*this);
    copy.set(key, std::move(value));
    return copy;
}

bool HelperParams::contains(const std::string& key) const {
    return doc_.contains(key);
}

const HelperDocument& HelperParams::at(const std::string& key) const {
    return doc_.at(key);
}

std::string requireString(const HelperDocument& doc, const std::string& key, const std::string& source) {
    auto it = doc.find(key);
    if (it == doc.end()) {
        throw RemoteRejection(source + ": result has no '" + key + "' field");
    }
    if (!it->is_string()) {
        throw RemoteRejection(source + ": result field '" + key + "' is not a string");
    }
    return it->get<std::string>();
}

bool requireBool(const HelperDocument& doc, const std::string& key, const std::string& source) {
    auto it = doc.find(key);
    if (it == doc.end()) {
        throw RemoteRejection(source + ": result has no '" + key + "' field");
    }
    if (!it->is_boolean()) {
        throw RemoteRejection(source + ": result field '" + key + "' is not a boolean");
    }
    return it->get<bool>();
}
