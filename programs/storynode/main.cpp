#include "script.hpp"

#include <services/system/Genesis.hpp>
#include <storybase/Chain.hpp>
#include <storybase/log.hpp>

#include <boost/program_options/options_description.hpp>
#include <boost/program_options/parsers.hpp>
#include <boost/program_options/positional_options.hpp>
#include <boost/program_options/variables_map.hpp>

#include <filesystem>
#include <fstream>
#include <iostream>

using namespace storybase;
using SystemService::GenesisConfig;
using SystemService::InitialBalance;

const char usage[] = "USAGE: storynode [options] [script]";

int main(int argc, char* argv[])
{
   std::vector<std::string>    accountNames;
   std::vector<InitialBalance> balances;
   std::string                 tokenUri;
   std::string                 configPath;
   std::string                 scriptPath;

   namespace po = boost::program_options;

   po::options_description desc("storynode");
   po::options_description common_opts("Options");
   auto                    opt = common_opts.add_options();
   opt("account,a", po::value(&accountNames)->default_value({}, "")->value_name("name"),
       "Account to create at genesis");
   opt("balance,b", po::value(&balances)->default_value({}, "")->value_name("name:amount"),
       "Tokens to issue to an account at genesis");
   opt("token-uri", po::value(&tokenUri)->default_value("")->value_name("URI"),
       "Metadata URI reported for every story token");
   loggers::add_options(common_opts);
   desc.add(common_opts);

   // These should be usable on the command line and shown in help
   auto add_cmdonly = [&](auto& opts)
   {
      opts.add_options()("help,h", "Show this message")(
          "config,c", po::value(&configPath)->value_name("path"), "Read options from this file");
   };
   add_cmdonly(desc);
   desc.add_options()("script", po::value(&scriptPath), "Action script; stdin if omitted");

   po::positional_options_description positional;
   positional.add("script", 1);

   po::variables_map vm;
   try
   {
      po::store(po::command_line_parser(argc, argv).options(desc).positional(positional).run(),
                vm);
      if (vm.count("config"))
      {
         auto          path = vm["config"].as<std::string>();
         std::ifstream in(path);
         if (!in)
            throw std::runtime_error("cannot open config file " + path);
         po::store(po::parse_config_file(in, common_opts), vm);
      }
      po::notify(vm);
   }
   catch (std::exception& e)
   {
      if (!vm.count("help"))
      {
         std::cerr << e.what() << "\n";
         return 1;
      }
   }

   if (vm.count("help"))
   {
      add_cmdonly(common_opts);
      std::cerr << usage << "\n\n";
      std::cerr << common_opts << "\n";
      return 1;
   }

   try
   {
      loggers::configure(vm);

      GenesisConfig config;
      config.balances = balances;
      config.tokenUri = tokenUri;
      for (const auto& name : accountNames)
      {
         auto account = AccountNumber{name};
         if (!account.value || account.str() != name)
            throw std::runtime_error("invalid account name: " + name);
         config.accounts.push_back(account);
      }

      Chain chain;
      SystemService::boot(chain, config);

      storynode::ScriptStats stats;
      if (scriptPath.empty() || scriptPath == "-")
      {
         stats = storynode::runScript(chain, std::cin, std::cout);
      }
      else
      {
         if (!std::filesystem::is_regular_file(scriptPath))
            throw std::runtime_error("cannot find script " + scriptPath);
         std::ifstream in(scriptPath);
         if (!in)
            throw std::runtime_error("cannot open script " + scriptPath);
         stats = storynode::runScript(chain, in, std::cout);
      }

      STORYBASE_LOG(loggers::generic::get(), info)
          << "Script finished: " << stats.succeeded << " succeeded, " << stats.failed
          << " failed, " << stats.malformed << " malformed";
      return 0;
   }
   catch (std::exception& e)
   {
      STORYBASE_LOG(loggers::generic::get(), error) << e.what();
   }
   return 1;
}
