#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

using HelperDocument = nlohmann::ordered_json;

// The JSON parameter set handed to every helper. Phases extend it as the
// run progresses; keys keep their insertion order in the written document.
class HelperParams {
public:
    HelperParams();

    void set(const std::string& key, HelperDocument value);
    void setStringList(const std::string& key, const std::vector<std::string>& values);

    // Copy of this set with one more key, leaving this set untouched.
    HelperParams with(const std::string& key, HelperDocument value) const;

    bool contains(const std::string& key) const;
    const HelperDocument& at(const std::string& key) const;
    const HelperDocument& document() const { return doc_; }

    std::string dump(int indent = -1) const { return doc_.dump(indent); }

private:
    HelperDocument doc_;
};

// Typed access to required fields of a helper's JSON result.
// A missing or mistyped field throws RemoteRejection.
std::string requireString(const HelperDocument& doc, const std::string& key, const std::string& source);
bool requireBool(const HelperDocument& doc, const std::string& key, const std::string& source);
