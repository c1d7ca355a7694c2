#include <iostream>
#include <string>
#include <vector>
#include "catalog.hpp"
#include "filesystem.hpp"
#include "orchestrator.hpp"
#include "plan_runner.hpp"
#include "plan_store.hpp"

static void usage() {
    std::cerr << "usage:\n"
              << "  convplan [-v] plan <dataset.json> <catalog.json> <entity.json> <schema.avsc> <flattenedOrc|nestedOrc> [plans.db]\n"
              << "  convplan [-v] publish <plans.db> <workUnitId> [--dry-run]\n"
              << "plans.db may be a sqlite file or a postgresql:// conninfo\n"
              << "--dry-run logs the statements but still moves and deletes the local directories" << std::endl;
}

static Dialect dialect_of(const std::string& dsn) {
    if (dsn.rfind("postgresql://", 0) == 0 || dsn.rfind("postgres://", 0) == 0 || dsn.find("host=") != std::string::npos)
        return Dialect::Postgres;
    return Dialect::SQLite;
}

static void load_json(const std::string& path, jdoc& doc) {
    if (!jhlp::parse_file(path, doc)) THROW("cannot read %s", path.c_str());
}

static int cmd_plan(const std::vector<std::string>& args) {
    if (args.size() < 5) { usage(); return 2; }
    jdoc dataset_doc, catalog_doc, entity_doc;
    load_json(args[0], dataset_doc);
    load_json(args[1], catalog_doc);
    load_json(args[2], entity_doc);

    jdoc schema_doc;
    load_json(args[3], schema_doc);
    Schema target;
    if (!Schema::from_avro(schema_doc, target)) THROW("%s is not an avro schema", args[3].c_str());

    ConversionEntity entity;
    if (!ConversionEntity::from_json(entity_doc, entity)) THROW("%s is not a conversion entity", args[2].c_str());

    ConversionOrchestrator orchestrator(
        DatasetConfig::from_json(dataset_doc),
        Catalog::connect(CatalogConfig::from_json(catalog_doc)),
        std::make_shared<LocalFileSystem>());

    ConversionResult result = orchestrator.plan(entity, target, output_format(args[4]));
    if (!result.plan) {
        std::cout << "[*] No " << args[4] << " conversion configured, nothing to do." << std::endl;
        return 0;
    }

    std::cout << "[*] Staging statements:" << std::endl;
    for (const auto& s : result.entity.statements) std::cout << s << ";\n" << std::endl;
    std::cout << "[*] Publish plan:" << std::endl;
    std::cout << result.plan->to_json(true) << std::endl;

    if (args.size() > 5) {
        PlanStore store(args[5], dialect_of(args[5]));
        store.init();
        store.save(result.entity.work_unit_id, *result.plan);
    }
    return 0;
}

static int cmd_publish(const std::vector<std::string>& args) {
    if (args.size() < 2) { usage(); return 2; }
    bool dry_run = args.size() > 2 && args[2] == "--dry-run";

    PlanStore store(args[0], dialect_of(args[0]));
    store.init();
    auto plan = store.load(args[1]);
    if (!plan) {
        std::cerr << "no publish plan stored for " << args[1] << std::endl;
        return 1;
    }

    if (!dry_run) {
        // statements need a query engine; only the dry run is built in
        std::cerr << "no statement executor configured, use --dry-run" << std::endl;
        return 2;
    }
    DryRunExecutor executor;
    LocalFileSystem fs;
    PlanRunner runner(executor, fs);
    runner.publish(*plan);
    runner.cleanup(*plan);
    store.remove(args[1]);
    return 0;
}

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    if (!args.empty() && args[0] == "-v") {
        set_log_level(LogLevel::Debug);
        args.erase(args.begin());
    }
    if (args.empty()) { usage(); return 2; }

    std::string cmd = args[0];
    args.erase(args.begin());
    try {
        if (cmd == "plan") return cmd_plan(args);
        if (cmd == "publish") return cmd_publish(args);
    } catch (const ConvError& e) {
        std::cerr << errkind(e.kind()) << " error: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "error: " << e.what() << std::endl;
        return 1;
    }
    usage();
    return 2;
}
