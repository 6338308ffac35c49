#include <boost/program_options.hpp>

#include <pari/chain/chain_database.hpp>
#include <pari/chain/exceptions.hpp>
#include <pari/chain/transaction_evaluation_state.hpp>

#include <fc/filesystem.hpp>
#include <fc/io/json.hpp>
#include <fc/log/file_appender.hpp>
#include <fc/log/logger.hpp>
#include <fc/log/logger_config.hpp>
#include <fc/reflect/variant.hpp>
#include <fc/variant_object.hpp>

#include <iostream>

struct config
{
   fc::logging_config            logging;
   fc::optional<std::string>     genesis_file;
};

FC_REFLECT( config, (logging)(genesis_file) )

using namespace pari::chain;

fc::path            get_data_dir( const boost::program_options::variables_map& option_variables );
config              load_config( const fc::path& datadir );
fc::logging_config  create_default_logging_config( const fc::path& datadir );
chain_database_ptr  load_chain_database( const fc::path& datadir, const config& cfg,
                                         const boost::program_options::variables_map& option_variables );
void                update_clock( const chain_database_ptr& chain, const boost::program_options::variables_map& option_variables );
void                apply_transaction( const chain_database_ptr& chain, const fc::path& datadir,
                                       const boost::program_options::variables_map& option_variables );
void                show_state( const chain_database_ptr& chain, const std::string& what );

int main( int argc, char** argv )
{
   boost::program_options::options_description option_config("Allowed options");
   option_config.add_options()("data-dir", boost::program_options::value<std::string>(), "state and configuration directory")
                              ("help", "display this help message")
                              ("genesis-json", boost::program_options::value<std::string>(), "initialize state from the given genesis file (only used when the data directory holds no state)")
                              ("tick", boost::program_options::value<uint64_t>(), "advance the host clock to this tick")
                              ("timestamp", boost::program_options::value<std::string>(), "wall clock time reported with --tick, ISO format")
                              ("epoch", boost::program_options::value<uint64_t>(), "override the epoch the host reports for the current tick")
                              ("apply", boost::program_options::value<std::string>(), "evaluate the signed transaction in this json file")
                              ("signer", boost::program_options::value< std::vector<std::string> >()->composing(), "name of an account that signed the transaction (repeatable)")
                              ("dry-run", "evaluate --apply without committing and print the staged records")
                              ("show", boost::program_options::value<std::string>(), "print state: clock, settings, treasury, balances, pools, predictions, ledgers or all");

   boost::program_options::positional_options_description positional_config;
   positional_config.add("data-dir", 1);

   boost::program_options::variables_map option_variables;
   try
   {
     boost::program_options::store(boost::program_options::command_line_parser(argc, argv).
       options(option_config).positional(positional_config).run(), option_variables);
     boost::program_options::notify(option_variables);
   }
   catch (boost::program_options::error&)
   {
     std::cerr << "Error parsing command-line options\n\n";
     std::cerr << option_config << "\n";
     return 1;
   }

   if (option_variables.count("help"))
   {
     std::cout << option_config << "\n";
     return 0;
   }

   try {
      fc::path datadir = get_data_dir( option_variables );
      if( !fc::exists( datadir ) )
         fc::create_directories( datadir );

      auto cfg   = load_config( datadir );
      fc::configure_logging( cfg.logging );

      auto chain = load_chain_database( datadir, cfg, option_variables );

      if( option_variables.count("tick") || option_variables.count("epoch") )
      {
         update_clock( chain, option_variables );
         chain->save( datadir );
      }

      if( option_variables.count("apply") )
         apply_transaction( chain, datadir, option_variables );

      if( option_variables.count("show") )
         show_state( chain, option_variables["show"].as<std::string>() );
   }
   catch ( const fc::exception& e )
   {
      std::cerr << "------------ error --------------\n"
                << e.to_detail_string() << "\n";
      wlog( "${e}", ("e", e.to_detail_string() ) );
      return 1;
   }
   return 0;
}

fc::path get_data_dir( const boost::program_options::variables_map& option_variables )
{ try {
   fc::path datadir;
   if( option_variables.count("data-dir") )
      datadir = fc::path( option_variables["data-dir"].as<std::string>().c_str() );
   else
      datadir = fc::app_path() / ".pari";
   return datadir;
} FC_RETHROW_EXCEPTIONS( warn, "error loading config" ) }

fc::logging_config create_default_logging_config( const fc::path& datadir )
{
   fc::logging_config cfg = fc::logging_config::default_config();

   fc::file_appender::config ac;
   ac.filename = datadir / "default.log";
   ac.truncate = false;
   ac.flush    = true;

   cfg.appenders.push_back( fc::appender_config( "default_file", "file", fc::variant( ac ) ) );

   for( fc::logger_config& lc : cfg.loggers )
   {
      if( lc.name == "default" )
         lc.appenders.push_back( "default_file" );
   }
   return cfg;
}

config load_config( const fc::path& datadir )
{ try {
      auto config_file = datadir / "config.json";
      config cfg;
      if( fc::exists( config_file ) )
      {
         std::cout << "Loading config " << config_file.generic_string() << "\n";
         cfg = fc::json::from_file( config_file ).as<config>();
      }
      else
      {
         std::cerr << "Creating default config file " << config_file.generic_string() << "\n";
         cfg.logging = create_default_logging_config( datadir );
         fc::json::save_to_file( cfg, config_file );
      }
      return cfg;
} FC_RETHROW_EXCEPTIONS( warn, "unable to load config file ${cfg}", ("cfg",datadir/"config.json") ) }

chain_database_ptr load_chain_database( const fc::path& datadir, const config& cfg,
                                        const boost::program_options::variables_map& option_variables )
{ try {
   chain_database_ptr chain = std::make_shared<chain_database>();

   fc::optional<fc::path> genesis_file;
   if( option_variables.count("genesis-json") )
      genesis_file = fc::path( option_variables["genesis-json"].as<std::string>() );
   else if( cfg.genesis_file.valid() )
      genesis_file = fc::path( *cfg.genesis_file );

   chain->open( datadir, genesis_file );
   if( !fc::exists( datadir / "state.json" ) )
      chain->save( datadir );

   return chain;
} FC_RETHROW_EXCEPTIONS( warn, "unable to open state from ${data_dir}", ("data_dir",datadir) ) }

void update_clock( const chain_database_ptr& chain, const boost::program_options::variables_map& option_variables )
{ try {
   if( option_variables.count("tick") )
   {
      fc::time_point_sec timestamp = fc::time_point::now();
      if( option_variables.count("timestamp") )
         timestamp = fc::time_point_sec::from_iso_string( option_variables["timestamp"].as<std::string>() );
      chain->advance_to_tick( option_variables["tick"].as<uint64_t>(), timestamp );
   }

   if( option_variables.count("epoch") )
   {
      clock_state clock = chain->get_clock();
      clock.epoch = option_variables["epoch"].as<uint64_t>();
      chain->set_clock( clock );
   }

   const clock_state clock = chain->get_clock();
   std::cout << "tick " << clock.tick << " epoch " << clock.epoch << "\n";
} FC_CAPTURE_AND_RETHROW() }

void apply_transaction( const chain_database_ptr& chain, const fc::path& datadir,
                        const boost::program_options::variables_map& option_variables )
{ try {
   const fc::path trx_file( option_variables["apply"].as<std::string>() );
   FC_ASSERT( fc::exists( trx_file ), "Transaction file '${file}' was not found.", ("file",trx_file) );

   signed_transaction trx = fc::json::from_file( trx_file ).as<signed_transaction>();
   if( option_variables.count("signer") )
   {
      for( const std::string& name : option_variables["signer"].as< std::vector<std::string> >() )
         trx.sign( make_address( name ) );
   }

   if( option_variables.count("dry-run") )
   {
      const pending_chain_state_ptr pending = chain->simulate_transaction( trx );
      std::cout << fc::json::to_pretty_string( pending->to_variant() ) << "\n";
      return;
   }

   chain->evaluate_transaction( trx );
   chain->save( datadir );

   ilog( "applied transaction ${id} with ${n} operations", ("id",trx.id())("n",trx.operations.size()) );
   std::cout << "applied " << std::string( trx.id() ) << "\n";
} FC_CAPTURE_AND_RETHROW() }

void show_state( const chain_database_ptr& chain, const std::string& what )
{ try {
   fc::mutable_variant_object result;
   const bool all = what == "all";

   if( all || what == "clock" )       result( "clock", chain->get_clock() );
   if( all || what == "settings" )    result( "settings", chain->get_settings() );
   if( all || what == "treasury" )    result( "treasury", chain->get_treasury() );
   if( all || what == "balances" )    result( "balances", chain->get_balances() );
   if( all || what == "pools" )       result( "pools", chain->get_pools() );
   if( all || what == "predictions" ) result( "predictions", chain->get_predictions() );
   if( all || what == "ledgers" )     result( "ledgers", chain->get_ledgers() );

   if( result.size() == 0 )
      FC_THROW_EXCEPTION( fc::invalid_arg_exception, "unknown state section ${what}", ("what",what) );

   std::cout << fc::json::to_pretty_string( fc::variant( result ) ) << "\n";
} FC_CAPTURE_AND_RETHROW( (what) ) }
