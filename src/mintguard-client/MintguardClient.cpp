// Security services
#include "mintguard/Security/AccountSnapshot.hpp"
#include "mintguard/Security/SecurityRecord.hpp"
#include "mintguard/Security/SecurityRecordJson.hpp"
#include "mintguard/Security/TokenInspector/TokenInspector.hpp"

// Solana types
#include "mintguard/Solana/TokenMetadata.hpp"

// Utils
#include "mintguard/Util/Logger.hpp"
#include "mintguard/Util/Utils.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/use_future.hpp>
#include <boost/assert.hpp>
#include <boost/json/serialize.hpp>

#include <boost/program_options.hpp>

#include <fmt/format.h>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <unordered_map>

namespace po = boost::program_options;
namespace fs = std::filesystem;

//
// Mintguard command-line tool.
//

namespace Mintguard
{

static std::string get_version( ) { return "0.1.0"; }

static std::string log_level_default( ) { return "info"; }

// Snapshot options.

#define DECLARE_ACCOUNTS_FILE_OPTION( accountsFile ) \
( \
    "accounts_file,a", \
    po::value< fs::path >( accountsFile )->required( ), \
    "Path to a json snapshot of account infos keyed by address." \
)

#define DECLARE_MINTS_OPTION( mints ) \
( \
    "mint,m", \
    po::value< std::vector< std::string > >( mints )->multitoken( ), \
    "Mint addresses to inspect, every token-program account in the snapshot if omitted." \
)

#define DECLARE_MINT_OPTION( mint ) \
( \
    "mint,m", \
    po::value< std::string >( mint )->required( ), \
    "Mint address." \
)

#define DECLARE_OUTPUT_OPTION( outputPath ) \
( \
    "output,o", \
    po::value< fs::path >( outputPath ), \
    "Write security records to this file instead of stdout." \
)

class ClientCommand
{
public:
    ClientCommand( const std::string & name ) : _name( name ), _commandOptions( _name ) { }
    virtual ~ClientCommand( ) = default;

    const std::string & command_name( ) const { return _name; }
    const po::options_description & get_command_options( ) const { return _commandOptions; }

    // Returns 0 on success, otherwise error code.
    virtual int on_command( ) const & = 0;

protected:
    std::string _name;
    po::options_description _commandOptions;

    mutable MintguardLogger _logger;
};

class InspectCommand : public ClientCommand
{
public:
    InspectCommand( ) : ClientCommand( "inspect" )
    {
        _commandOptions.add_options( )
            DECLARE_ACCOUNTS_FILE_OPTION( &_accountsFile )
            DECLARE_MINTS_OPTION( &_mints )
            DECLARE_OUTPUT_OPTION( &_outputPath );
    }

    int on_command( ) const & override
    {
        Security::AccountSnapshot snapshot;
        std::vector< Core::PublicKey > mints;
        try
        {
            snapshot = Security::AccountSnapshot::load( _accountsFile );
            for ( const auto & mint : _mints )
            {
                mints.push_back( Core::PublicKey::from_base58( mint ) );
            }
        }
        catch ( const MintguardError & ex )
        {
            MINTGUARD_LOG_ERROR( _logger ) << "Error loading accounts: " << ex.what( );
            return 1;
        }

        if ( mints.empty( ) )
        {
            mints = snapshot.token_accounts( );
        }

        MINTGUARD_LOG_INFO( _logger )
            << fmt::format( "Loaded {} accounts from {}, inspecting {} mints", snapshot.size( ), _accountsFile.string( ), mints.size( ) );

        std::ofstream outputFile;
        if ( !_outputPath.empty( ) )
        {
            outputFile.open( _outputPath );
            if ( !outputFile )
            {
                MINTGUARD_LOG_ERROR( _logger ) << "Unable to open output file: " << _outputPath.string( );
                return 1;
            }
        }
        std::ostream & output = _outputPath.empty( ) ? std::cout : outputFile;

        std::vector< Security::Inspection > inspections;
        {
            boost::asio::io_context ioContext;
            Security::TokenInspector tokenInspector( ioContext, snapshot );
            inspections = tokenInspector.inspect_batch( mints, boost::asio::use_future ).get( );
        }

        for ( const auto & inspection : inspections )
        {
            auto record = Security::make_security_record( inspection );

            MINTGUARD_LOG_INFO( _logger )
                << fmt::format( "Token {}: status={}, summary={}",
                                record.mintAddress,
                                Security::security_status_name( record.securityStatus ),
                                record.healthSummary );

            output << boost::json::serialize( boost::json::value_from( record ) ) << "\n";
        }
        output.flush( );

        return 0;
    }

private:
    fs::path _accountsFile;
    std::vector< std::string > _mints;
    fs::path _outputPath;
};

class DeriveMetadataAddressCommand : public ClientCommand
{
public:
    DeriveMetadataAddressCommand( ) : ClientCommand( "derive_metadata_address" )
    {
        _commandOptions.add_options( )
            DECLARE_MINT_OPTION( &_mint );
    }

    int on_command( ) const & override
    {
        Core::PublicKey mint;
        if ( !mint.init_from_base58( _mint ) )
        {
            MINTGUARD_LOG_ERROR( _logger ) << "Invalid mint address: " << _mint;
            return 1;
        }

        auto metadataAddress = Solana::find_metadata_address( mint );
        if ( !metadataAddress )
        {
            MINTGUARD_LOG_ERROR( _logger ) << "No viable bump seed for mint: " << _mint;
            return 1;
        }

        std::cout << "Mint: " << mint << std::endl;
        std::cout << "Metadata address: " << metadataAddress->first << std::endl;
        std::cout << "Bump: " << static_cast< int >( metadataAddress->second ) << std::endl;

        return 0;
    }

private:
    std::string _mint;
};

class MintguardClient
{
public:
    explicit MintguardClient( const std::string & programName )
        : _programName( programName )
        , _clientArguments( "Options" )
        , _optionalArguments( "optional arguments" )
    {
        _optionalArguments.add_options( )
            ( "help,h", "Show the help message and exit" )
            (
                "log_level",
                po::value< std::string >( )->default_value( log_level_default( ) ),
                "Filter console logs by severity"
            )
            ( "version,V", "Show the version number and exit" );

        _clientArguments.add( _optionalArguments );

        register_command( std::make_unique< Mintguard::InspectCommand >( ) );
        register_command( std::make_unique< Mintguard::DeriveMetadataAddressCommand >( ) );
    }

    std::optional< po::variables_map > parse_command_line( int argc, char ** argv )
    {
        try
        {
            po::variables_map parsedArgs;
            po::store(
                po::command_line_parser( argc, argv ).options( _clientArguments ).run( ),
                parsedArgs );
            if ( !parsedArgs.count( "help" ) )
            {
                notify( parsedArgs );
            }
            return { parsedArgs };
        }
        catch ( std::exception & ex )
        {
            print_usage_error( ex.what( ) );
            return { };
        }
    }

    bool is_command_valid( const std::string & command ) const
    {
        return _clientCommands.contains( command );
    }

    int execute_command( const std::string & command ) const
    {
        const auto & findCommand = _clientCommands.find( command );
        if ( findCommand == _clientCommands.end( ) )
        {
            print_usage_error( "invalid command: " + command );
            return 1;
        }
        return findCommand->second->on_command( );
    }

    void add_command( const std::string & command )
    {
        const auto & findCommand = _clientCommands.find( command );
        BOOST_ASSERT_MSG( findCommand != _clientCommands.end( ), "Unknown command" );

        const auto * clientCommand = findCommand->second.get( );
        _clientArguments.add( clientCommand->get_command_options( ) );
    }

    void print_usage( ) const
    {
        std::cout << "usage: " << _programName << " [-h] command ...\n" << std::endl;
        std::cout << _programName << " is a tool for inspecting the authority and metadata state of token mints\n" << std::endl;
    };

    void print_usage_error( const std::string & error ) const
    {
        std::cerr << "usage: " << _programName << " [-h] command ...\n";
        std::cerr << _programName << ": error: " << error << std::endl;
    }

    void print_help( ) const
    {
        print_usage( );
        std::cout << _clientArguments << std::endl;
    }

    void print_positional_help( ) const
    {
        print_help( );

        std::cout << "positional arguments:\n";
        std::cout << "  command:\n";
        for ( const auto & [ commandName, _ ] : _clientCommands )
        {
            std::cout << "    " << commandName << "\n";
        }
        std::cout << std::endl;
    }

    void print_version( )
    {
        std::cout << _programName << " version: " << get_version( ) << std::endl;
    }

private:
    void register_command( std::unique_ptr< Mintguard::ClientCommand > command )
    {
        const auto & commandName = command->command_name( );
        auto inserted = _clientCommands.emplace( commandName, std::move( command ) ).second;
        BOOST_ASSERT_MSG( inserted, "Registered duplicate command" );
    }

    std::string _programName;

    po::options_description _clientArguments;
    po::options_description _optionalArguments;
    std::unordered_map< std::string, std::unique_ptr< Mintguard::ClientCommand > > _clientCommands;
};

} // namespace Mintguard

int main( int argc, char ** argv )
{
    auto programName = fs::path( argv[ 0 ] ).filename( );
    Mintguard::MintguardClient mintguardClient( programName );

    std::string command;
    if ( argc > 1 )
    {
        command = argv[ 1 ];
        if ( mintguardClient.is_command_valid( command ) )
        {
            mintguardClient.add_command( command );
        }
    }

    auto parsedArgs = mintguardClient.parse_command_line( argc, argv );
    if ( !parsedArgs ) return 1;

    if ( parsedArgs->count( "help" ) )
    {
        mintguardClient.is_command_valid( command ) ? mintguardClient.print_help( ) : mintguardClient.print_positional_help( );
        return 0;
    }

    if ( parsedArgs->count( "version" ) )
    {
        mintguardClient.print_version( );
        return 0;
    }

    // Initialize logger and severity filter.
    boost::log::trivial::severity_level logLevel;
    const auto & logLevelArg = parsedArgs->find( "log_level" );
    BOOST_ASSERT_MSG( logLevelArg != parsedArgs->end( ), "Expected log_level command-line option" );

    const auto & logLevelString = logLevelArg->second.as< std::string >( );
    auto success = boost::log::trivial::from_string( logLevelString.data( ), logLevelString.size( ), logLevel );
    if ( !success )
    {
        std::cerr << "Invalid log-level option, valid options are: trace, debug, info, warning, error" << std::endl;
        return 1;
    }
    Mintguard::init_logger( logLevel );

    // Execute user's command.
    return mintguardClient.execute_command( command );
}
