// clean address sentences, one per line

#include <iostream>
#include <fstream>
#include <string>
#include <stdexcept>
#include <cstdlib>

#include <boost/program_options.hpp>
#include <boost/filesystem.hpp>

#include "addrlex/lexical_rules.hpp"
#include "addrlex/tokenize.hpp"

#include "utils/resource.hpp"

typedef boost::filesystem::path path_type;

path_type input_file = "-";
path_type output_file = "-";

std::string rules_name = "dra";

bool special = false;
bool join = false;
bool list_rules = false;

int debug = 0;

void options(int argc, char** argv);

int main(int argc, char** argv)
{
  try {
    options(argc, argv);
    
    if (list_rules) {
      std::cout << addrlex::LexicalRules::lists();
      return 0;
    }
    
    if (input_file != "-" && ! boost::filesystem::exists(input_file))
      throw std::runtime_error("no input file? " + input_file.string());
    
    const addrlex::LexicalRules& rules = addrlex::LexicalRules::create(rules_name);
    
    std::ifstream ifs;
    if (input_file != "-") {
      ifs.open(input_file.string().c_str());
      if (! ifs)
	throw std::runtime_error("unable to open: " + input_file.string());
    }
    std::istream& is = (input_file == "-" ? std::cin : ifs);
    
    std::ofstream ofs;
    if (output_file != "-") {
      ofs.open(output_file.string().c_str());
      if (! ofs)
	throw std::runtime_error("unable to open: " + output_file.string());
    }
    std::ostream& os = (output_file == "-" ? std::cout : ofs);
    
    const utils::resource start;
    
    size_t num_sentence = 0;
    size_t num_postal = 0;
    
    addrlex::token_set_type tokens;
    addrlex::token_set_type joined;
    
    std::string line;
    while (std::getline(is, line)) {
      std::string cleaned = rules.clean_sentence(line);
      
      if (special) {
	const std::string stripped = rules.run_special_rules(cleaned);
	
	// run_special_rules changes a sentence only when postal junk is found
	num_postal += (stripped != cleaned);
	
	cleaned = stripped;
      }
      
      if (join) {
	addrlex::tokenize(cleaned, tokens);
	rules.join(tokens, joined);
	cleaned = addrlex::untokenize(joined);
      }
      
      if (debug)
	std::cerr << "original: " << line << std::endl
		  << "cleaned: " << cleaned << std::endl;
      
      os << cleaned << '\n';
      ++ num_sentence;
    }
    os << std::flush;
    
    const utils::resource end;
    
    if (debug >= 2)
      std::cerr << "rules: " << rules.algorithm() << std::endl
		<< "sentences: " << num_sentence << std::endl
		<< "postal junk: " << num_postal << std::endl
		<< "cpu time:  " << end.cpu_time() - start.cpu_time() << std::endl
		<< "user time: " << end.user_time() - start.user_time() << std::endl;
  }
  catch (std::exception& err) {
    std::cerr << "error: " << err.what() << std::endl;
    return -1;
  }
  return 0;
}

void options(int argc, char** argv)
{
  namespace po = boost::program_options;
  
  po::options_description desc("options");
  desc.add_options()
    ("input",       po::value<path_type>(&input_file)->default_value(input_file),   "input file")
    ("output",      po::value<path_type>(&output_file)->default_value(output_file), "output file")
    
    ("rules",       po::value<std::string>(&rules_name)->default_value(rules_name), "lexical rules")
    ("rules-list",  po::bool_switch(&list_rules),                                   "list of lexical rules")
    
    ("special",     po::bool_switch(&special), "remove postal junk and flag it")
    ("join",        po::bool_switch(&join),    "join tokens by join rules")
    
    ("debug", po::value<int>(&debug)->implicit_value(1), "debug level")
    
    ("help", "help message");
  
  po::variables_map vm;
  po::store(po::parse_command_line(argc, argv, desc, po::command_line_style::unix_style & (~po::command_line_style::allow_guessing)), vm);
  po::notify(vm);
  
  if (vm.count("help")) {
    std::cout << argv[0] << " [options]" << '\n' << desc << '\n';
    exit(0);
  }
}
