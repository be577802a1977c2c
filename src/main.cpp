#include "cli.hpp"
#include "embedder.hpp"
#include "knowledge.hpp"
#include "log.hpp"
#include "server.hpp"
#include "store.hpp"

#include <filesystem>
#include <iostream>
#include <iterator>

static std::string read_text(const std::string& arg) {
  if (arg != "-") return arg;
  return std::string((std::istreambuf_iterator<char>(std::cin)), std::istreambuf_iterator<char>());
}

// One-shot modes become a single request through the same dispatcher as serve.
static nlohmann::json request_for(const Args& args) {
  nlohmann::json req = {{"cmd", args.mode}};
  if (args.mode == "save") {
    req["project"] = args.project;
    req["content"] = read_text(args.text);
    if (!args.id.empty()) req["id"] = args.id;
  } else if (args.mode == "search") {
    req["project"] = args.project;
    req["query"] = args.text;
    req["k"] = args.k;
    req["threshold"] = args.threshold;
  } else if (args.mode == "similar") {
    req["id"] = args.id;
    req["k"] = args.k;
  } else if (args.mode == "classify") {
    req["text"] = read_text(args.text);
  } else if (args.mode == "tags") {
    req["text"] = read_text(args.text);
    req["max_tags"] = args.max_tags;
  } else if (args.mode == "cont") {
    req["project"] = args.project;
    req["text"] = read_text(args.text);
  } else {
    req["project"] = args.project;
  }
  return req;
}

int main(int argc, char** argv) {
  auto args = parse_cli(argc, argv);
  set_log_level(parse_log_level(args.log_level));

  try {
    auto dir = std::filesystem::path(args.sqlite_path).parent_path();
    if (!dir.empty()) std::filesystem::create_directories(dir);

    Store store(args.sqlite_path);
    auto embedder = make_embedder(args.embed_model, args.dim);
    KnowledgeService svc(store, *embedder, args.max_tags);
    Server server(svc, args.k, args.threshold, args.max_tags);

    if (args.mode == "serve") {
      log_info("main", "serving on stdin (db " + args.sqlite_path + ")");
      server.run(std::cin, std::cout);
      return 0;
    }

    auto resp = server.handle(request_for(args));
    std::cout << dump_line(resp, 2) << "\n";
    return resp.contains("error") ? 2 : 0;
  } catch (const std::exception& e) {
    log_error("main", e.what());
    return 1;
  }
}
