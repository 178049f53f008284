#include "kenclient/client.hh"
#include "kenclient/config.hh"
#include "kenclient/exception.hh"
#include "kenclient/query.hh"

#include <boost/program_options.hpp>

#include <iostream>
#include <string>

int main(int argc, char *argv[]) {
  try {
    namespace po = boost::program_options;
    po::options_description options("Query options");
    kenclient::Config config;
    std::string model;

    options.add_options()
      ("help,h", po::bool_switch(), "Show this help message")
      ("model", po::value<std::string>(&model), "Language model file (ARPA or binary)")
      ("library_dir,L", po::value<std::string>(&config.library_directory), "Directory holding the KenLM engine library")
      ("library_name", po::value<std::string>(&config.library_name)->default_value(config.library_name), "Base name of the engine library")
      ("no_system_path", po::bool_switch(), "Do not fall back to the dynamic linker's search path")
      ("no_context,n", po::bool_switch(), "Do not wrap the input in <s> and </s>")
      ("sentence_totals,s", po::bool_switch(), "Sentence totals only")
      ("quiet,q", po::bool_switch(), "Don't log loading messages");
    po::positional_options_description positional;
    positional.add("model", 1);

    po::variables_map vm;
    po::store(po::command_line_parser(argc, argv).options(options).positional(positional).run(), vm);

    if (argc == 1 || vm["help"].as<bool>()) {
      std::cerr <<
        "Scores sentences from stdin, one per line, with a KenLM model loaded through\n"
        "the engine library.\n\n"
        "Usage: " << argv[0] << " [options] model\n\n" << options << std::endl;
      return 1;
    }

    po::notify(vm);
    if (model.empty()) {
      std::cerr << "A model file is required." << std::endl;
      return 1;
    }
    config.search_system_path = !vm["no_system_path"].as<bool>();
    if (vm["quiet"].as<bool>()) config.messages = NULL;

    kenclient::Client client(model, config);
    const bool sentence_context = !vm["no_context"].as<bool>();
    if (vm["sentence_totals"].as<bool>()) {
      kenclient::Query(client, std::cin, kenclient::BasicPrint(std::cout), sentence_context);
    } else {
      kenclient::Query(client, std::cin, kenclient::FullPrint(std::cout), sentence_context);
    }
    client.Release();
  } catch (const kenclient::LoadException &e) {
    std::cerr << e.what() << std::endl;
    return 2;
  } catch (const std::exception &e) {
    std::cerr << e.what() << std::endl;
    return 1;
  }
  return 0;
}
