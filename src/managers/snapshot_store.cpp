#include "snapshot_store.hpp"
#include <core/utils.hpp>
#include <core/log.hpp>
#include <yaml-cpp/yaml.h>
#include <fstream>

SnapshotStore::SnapshotStore(fs::path path) : state_path_(std::move(path)) {}

PersistedSnapshot SnapshotStore::load() const {
    PersistedSnapshot snap;

    std::error_code ec;
    if (!fs::exists(state_path_, ec)) {
        return snap;
    }

    try {
        YAML::Node root = YAML::LoadFile(state_path_.string());

        std::time_t saved = parse_iso_time(root["saved_at"].as<std::string>(""));
        if (saved > 0) snap.saved_at = std::chrono::system_clock::from_time_t(saved);

        if (root["instances"] && root["instances"].IsSequence()) {
            for (const auto& n : root["instances"]) {
                Instance inst;
                inst.id = n["id"].as<std::string>("");
                inst.region = n["region"].as<std::string>("");
                if (inst.id.empty() || inst.region.empty()) continue;
                inst.name = n["name"].as<std::string>(inst.id);
                inst.instance_type = n["type"].as<std::string>("");
                inst.public_ip = n["public_ip"].as<std::string>("");
                inst.private_ip = n["private_ip"].as<std::string>("");
                inst.launch_time = n["launch_time"].as<std::string>("");
                inst.state = parse_state(n["state"].as<std::string>(""));
                std::time_t confirmed = parse_iso_time(n["last_confirmed"].as<std::string>(""));
                if (confirmed > 0) inst.last_confirmed = std::chrono::system_clock::from_time_t(confirmed);
                snap.instances.push_back(inst);
            }
        }

        if (root["pinned"] && root["pinned"].IsSequence()) {
            for (const auto& n : root["pinned"]) {
                InstanceKey key{n["region"].as<std::string>(""), n["id"].as<std::string>("")};
                if (!key.region.empty() && !key.id.empty()) snap.pinned.insert(key);
            }
        }

    } catch (const std::exception& e) {
        ec2ctl_log(std::string("snapshot: ignoring unreadable state file: ") + e.what());
        return PersistedSnapshot{};
    }

    return snap;
}

Result<void> SnapshotStore::save(const PersistedSnapshot& snapshot) const {
    std::error_code ec;
    fs::create_directories(state_path_.parent_path(), ec);
    if (ec) {
        return Result<void>::Err(ErrorKind::Config, "cannot create " +
                                 state_path_.parent_path().string() + ": " + ec.message());
    }

    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "saved_at" << YAML::Value << to_iso(snapshot.saved_at);

    out << YAML::Key << "instances" << YAML::Value << YAML::BeginSeq;
    for (const auto& i : snapshot.instances) {
        out << YAML::BeginMap;
        out << YAML::Key << "id" << YAML::Value << i.id;
        out << YAML::Key << "region" << YAML::Value << i.region;
        out << YAML::Key << "name" << YAML::Value << i.name;
        out << YAML::Key << "type" << YAML::Value << i.instance_type;
        out << YAML::Key << "state" << YAML::Value << state_name(i.state);
        out << YAML::Key << "public_ip" << YAML::Value << i.public_ip;
        out << YAML::Key << "private_ip" << YAML::Value << i.private_ip;
        out << YAML::Key << "launch_time" << YAML::Value << i.launch_time;
        out << YAML::Key << "last_confirmed" << YAML::Value << to_iso(i.last_confirmed);
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;

    out << YAML::Key << "pinned" << YAML::Value << YAML::BeginSeq;
    for (const auto& k : snapshot.pinned) {
        out << YAML::Flow << YAML::BeginMap;
        out << YAML::Key << "region" << YAML::Value << k.region;
        out << YAML::Key << "id" << YAML::Value << k.id;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;

    out << YAML::EndMap;

    // Write beside the target and rename so a crash never leaves half a file
    fs::path tmp = state_path_;
    tmp += ".tmp";
    {
        std::ofstream fout(tmp.string(), std::ios::trunc);
        if (!fout) {
            return Result<void>::Err(ErrorKind::Config, "cannot write " + tmp.string());
        }
        fout << out.c_str() << "\n";
    }
    fs::rename(tmp, state_path_, ec);
    if (ec) {
        return Result<void>::Err(ErrorKind::Config, "cannot replace " + state_path_.string() +
                                 ": " + ec.message());
    }
    return Result<void>::Ok();
}
