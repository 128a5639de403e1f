#include "stevedore/migrate/retry_file.hpp"

#include <functional>
#include <sstream>

namespace stevedore::migrate {

namespace {

[[noreturn]] void parse_error(const std::string& path, size_t line_no, const std::string& what) {
    throw IOError(path + ":" + std::to_string(line_no) + ": " + what, "retry file", ErrorCode::PARSE_FAILED);
}

// Calls parse(fields, line_no) for every non-comment line starting with `kind`.
void read_records(const std::string& path, const std::string& kind,
                  const std::function<void(std::istringstream&, size_t)>& parse) {
    std::ifstream in(path);
    if (!in.is_open()) {
        throw IOError("cannot open retry file " + path, "read_records");
    }

    std::string line;
    size_t line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        size_t hash = line.find('#');
        if (hash != std::string::npos) line.erase(hash);

        std::istringstream fields(line);
        std::string tag;
        if (!(fields >> tag)) continue;
        if (tag != kind) {
            parse_error(path, line_no, "expected a '" + kind + "' record, found '" + tag + "'");
        }
        parse(fields, line_no);

        std::string extra;
        if (fields >> extra) {
            parse_error(path, line_no, "trailing field '" + extra + "'");
        }
    }
}

template<typename Item>
void restore_deadline(Item& item, int64_t timeout_ms, int escalations) {
    item.timeout = std::chrono::milliseconds(timeout_ms);
    item.escalations = escalations;
}

} // anonymous namespace

std::string format_item(const LifecycleItem& item) {
    const Partition& p = item.job.partition;
    int64_t a = 0;
    int64_t b = 0;
    if (auto* copy = std::get_if<phase::BulkCopy>(&item.job.phase)) {
        a = copy->cursor;
        b = copy->batch;
    } else if (auto* index = std::get_if<phase::BuildIndex>(&item.job.phase)) {
        a = static_cast<int64_t>(index->ordinal);
    }

    std::ostringstream os;
    os << "lifecycle " << p.number << " " << p.lo << " " << p.hi << " "
       << p.copy_lo << " " << p.copy_hi << " " << phase_name(item.job.phase) << " "
       << a << " " << b << " " << item.timeout.count() << " " << item.escalations;
    return os.str();
}

std::string format_item(const CopyItem& item) {
    const CopyJob& j = item.job;
    std::ostringstream os;
    os << "copy " << j.from << " " << j.to << " " << j.key << " " << j.lo << " " << j.hi << " "
       << item.timeout.count() << " " << item.escalations;
    return os.str();
}

std::string format_item(const TableItem& item) {
    const TableJob& j = item.job;
    std::ostringstream os;
    os << "table " << (j.action == TableAction::Create ? "create" : "drop") << " ";
    if (j.parent) {
        os << "parent";
    } else {
        os << j.number;
    }
    os << " " << item.timeout.count() << " " << item.escalations;
    return os.str();
}

std::vector<LifecycleItem> load_lifecycle_items(const std::string& path, const PartitionLifecycle& lifecycle) {
    std::vector<LifecycleItem> items;
    read_records(path, "lifecycle", [&](std::istringstream& fields, size_t line_no) {
        Partition p;
        std::string name;
        int64_t a = 0, b = 0, timeout_ms = 0;
        int escalations = 0;
        if (!(fields >> p.number >> p.lo >> p.hi >> p.copy_lo >> p.copy_hi >> name
                     >> a >> b >> timeout_ms >> escalations)) {
            parse_error(path, line_no, "malformed lifecycle record");
        }

        auto step = phase_from_name(name);
        if (!step) parse_error(path, line_no, "unknown phase '" + name + "'");

        if (auto* copy = std::get_if<phase::BulkCopy>(&*step)) {
            if (b < 1) parse_error(path, line_no, "bulk-copy batch must be positive");
            copy->cursor = a;
            copy->batch = b;
        } else if (auto* index = std::get_if<phase::BuildIndex>(&*step)) {
            if (a < 0 || static_cast<size_t>(a) >= lifecycle.schema().indexes.size()) {
                parse_error(path, line_no, "no index #" + std::to_string(a));
            }
            index->ordinal = static_cast<size_t>(a);
        }

        LifecycleItem item = lifecycle.make_item(p, *step);
        restore_deadline(item, timeout_ms, escalations);
        items.push_back(std::move(item));
    });
    LOG_INFO("Loaded ", items.size(), " lifecycle item(s) from ", path);
    return items;
}

std::vector<CopyItem> load_copy_items(const std::string& path, const pool::RetryPolicy& policy) {
    std::vector<CopyItem> items;
    read_records(path, "copy", [&](std::istringstream& fields, size_t line_no) {
        CopyJob job;
        int64_t timeout_ms = 0;
        int escalations = 0;
        if (!(fields >> job.from >> job.to >> job.key >> job.lo >> job.hi >> timeout_ms >> escalations)) {
            parse_error(path, line_no, "malformed copy record");
        }
        if (job.lo >= job.hi) parse_error(path, line_no, "empty copy range");

        CopyItem item = make_copy_item(std::move(job), policy);
        restore_deadline(item, timeout_ms, escalations);
        items.push_back(std::move(item));
    });
    LOG_INFO("Loaded ", items.size(), " copy item(s) from ", path);
    return items;
}

std::vector<TableItem> load_table_items(const std::string& path, const db::PartitionSchema& schema,
                                        const pool::RetryPolicy& policy) {
    std::vector<TableItem> items;
    read_records(path, "table", [&](std::istringstream& fields, size_t line_no) {
        std::string action, target;
        int64_t timeout_ms = 0;
        int escalations = 0;
        if (!(fields >> action >> target >> timeout_ms >> escalations)) {
            parse_error(path, line_no, "malformed table record");
        }

        TableJob job;
        if (action == "create") {
            job.action = TableAction::Create;
        } else if (action == "drop") {
            job.action = TableAction::Drop;
        } else {
            parse_error(path, line_no, "unknown table action '" + action + "'");
        }

        if (target == "parent") {
            job.parent = true;
        } else {
            try {
                size_t used = 0;
                job.number = std::stoll(target, &used);
                if (used != target.size()) parse_error(path, line_no, "bad partition number '" + target + "'");
            } catch (const std::logic_error&) {
                parse_error(path, line_no, "bad partition number '" + target + "'");
            }
        }

        TableItem item = make_table_item(schema, job, policy);
        restore_deadline(item, timeout_ms, escalations);
        items.push_back(std::move(item));
    });
    LOG_INFO("Loaded ", items.size(), " table item(s) from ", path);
    return items;
}

} // namespace stevedore::migrate
