#include "pcomb-impl.h"

void pcomb_node::clear() {
    token.clear();
    children.clear();
    value = nullptr;
    noise = false;
}

pcomb_node pcomb_node::without_noise() const {
    pcomb_node result;
    result.token = token;
    result.value = value;
    result.noise = noise;
    for (const auto & child : children) {
        if (!child.noise) {
            result.children.push_back(child);
        }
    }
    return result;
}

nlohmann::ordered_json pcomb_node::to_json() const {
    nlohmann::ordered_json j;
    j["token"] = token;
    if (noise) {
        j["noise"] = true;
    }
    if (!value.is_null()) {
        j["value"] = value;
    }
    if (!children.empty()) {
        auto arr = nlohmann::ordered_json::array();
        for (const auto & child : children) {
            arr.push_back(child.to_json());
        }
        j["children"] = std::move(arr);
    }
    return j;
}
