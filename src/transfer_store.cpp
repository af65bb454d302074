#include "burnbox/transfer_store.hpp"

namespace burnbox {

MemoryTransferStore::~MemoryTransferStore() {
    for (auto& [_, rec] : slots_) {
        rec.wipe();
    }
}

bool MemoryTransferStore::insert(TransferRecord rec) {
    const std::string id = rec.id;
    return slots_.emplace(id, std::move(rec)).second;
}

TransferRecord* MemoryTransferStore::find(const std::string& id) {
    const auto it = slots_.find(id);
    return it == slots_.end() ? nullptr : &it->second;
}

bool MemoryTransferStore::erase(const std::string& id) {
    const auto it = slots_.find(id);
    if (it == slots_.end()) {
        return false;
    }
    it->second.wipe();
    slots_.erase(it);
    return true;
}

std::vector<std::string> MemoryTransferStore::sweepable(std::uint64_t now) const {
    std::vector<std::string> out;
    for (const auto& [id, rec] : slots_) {
        if (rec.in_flight) {
            continue;
        }
        if (rec.state != State::active || rec.due(now)) {
            out.push_back(id);
        }
    }
    return out;
}

std::vector<std::string> MemoryTransferStore::ids() const {
    std::vector<std::string> out;
    out.reserve(slots_.size());
    for (const auto& [id, _] : slots_) {
        out.push_back(id);
    }
    return out;
}

std::size_t MemoryTransferStore::size() const {
    return slots_.size();
}

}
