// Copyright (c) 2025 The ZKLend developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core_io.h"
#include "dbwrapper.h"
#include "lending/init.h"
#include "lending/lending.h"
#include "lending/lending_processor.h"
#include "lending/lendingdb.h"
#include "logging.h"
#include "streams.h"
#include "util/system.h"
#include "utilstrencodings.h"
#include "version.h"

#include <stdio.h>
#include <stdlib.h>
#include <stdexcept>
#include <univalue.h>

static const int CONTINUE_EXECUTION = -1;

typedef UniValue (*clifn_type)(const std::vector<std::string>& params, bool fHelp);

struct CLICommand
{
    std::string category;
    std::string name;
    clifn_type actor;
    std::vector<std::string> argNames;
};

static uint256 ParseAddress(const std::string& strName, const std::string& strHex)
{
    if (strHex.size() != 64 || !IsHex(strHex)) {
        throw std::runtime_error(strName + " must be a 64 character hex string (not '" + strHex + "')");
    }
    return uint256S(strHex);
}

static CLendingDB& LedgerDB()
{
    if (!g_lendingdb) {
        throw std::runtime_error("Lending database not initialized");
    }
    return *g_lendingdb;
}

// =============================================================================
// Protocol singletons
// =============================================================================

static UniValue getprotocol(const std::vector<std::string>& params, bool fHelp)
{
    if (fHelp || params.size() != 1) {
        throw std::runtime_error(
            "getprotocol \"address\"\n"
            "\nReturns the global protocol aggregates stored at address.\n"
            "\nResult:\n"
            "{\n"
            "  \"address\": \"hex\",              (string) record address\n"
            "  \"total_collateral\": n,         (numeric) collateral staked\n"
            "  \"total_loans\": n,              (numeric) outstanding principal\n"
            "  \"total_liquidity\": n,          (numeric) liquidity available to borrow\n"
            "  \"base_interest_rate\": n,       (numeric) percent per annum\n"
            "  \"utilization_rate\": n,         (numeric) loans * 100 / liquidity\n"
            "  \"min_collateral_lock_time\": n  (numeric) seconds between borrows\n"
            "}\n");
    }

    const uint256 address = ParseAddress("address", params[0]);
    ProtocolState protocol;
    if (!LedgerDB().ReadProtocolState(address, protocol)) {
        throw std::runtime_error("No protocol state at " + address.GetHex());
    }
    return ProtocolStateToJSON(protocol);
}

static UniValue gettreasury(const std::vector<std::string>& params, bool fHelp)
{
    if (fHelp || params.size() != 1) {
        throw std::runtime_error(
            "gettreasury \"address\"\n"
            "\nReturns the protocol treasury stored at address.\n");
    }

    const uint256 address = ParseAddress("address", params[0]);
    ProtocolTreasury treasury;
    if (!LedgerDB().ReadTreasury(address, treasury)) {
        throw std::runtime_error("No treasury at " + address.GetHex());
    }
    return TreasuryToJSON(treasury);
}

// =============================================================================
// Pools
// =============================================================================

static UniValue getlendingpool(const std::vector<std::string>& params, bool fHelp)
{
    if (fHelp || params.size() != 1) {
        throw std::runtime_error(
            "getlendingpool \"address\"\n"
            "\nReturns the lending pool stored at address.\n");
    }

    const uint256 address = ParseAddress("address", params[0]);
    LendingPool pool;
    if (!LedgerDB().ReadLendingPool(address, pool)) {
        throw std::runtime_error("No lending pool at " + address.GetHex());
    }
    return LendingPoolToJSON(pool);
}

static UniValue getcollateralpool(const std::vector<std::string>& params, bool fHelp)
{
    if (fHelp || params.size() != 1) {
        throw std::runtime_error(
            "getcollateralpool \"address\"\n"
            "\nReturns the collateral pool stored at address.\n");
    }

    const uint256 address = ParseAddress("address", params[0]);
    CollateralPool pool;
    if (!LedgerDB().ReadCollateralPool(address, pool)) {
        throw std::runtime_error("No collateral pool at " + address.GetHex());
    }
    return CollateralPoolToJSON(pool);
}

static UniValue getinstitutionalpool(const std::vector<std::string>& params, bool fHelp)
{
    if (fHelp || params.size() != 1) {
        throw std::runtime_error(
            "getinstitutionalpool \"address\"\n"
            "\nReturns the institutional pool stored at address, with its whitelist.\n");
    }

    const uint256 address = ParseAddress("address", params[0]);
    InstitutionalPool pool;
    if (!LedgerDB().ReadInstitutionalPool(address, pool)) {
        throw std::runtime_error("No institutional pool at " + address.GetHex());
    }
    return InstitutionalPoolToJSON(pool);
}

// =============================================================================
// Borrowers
// =============================================================================

static UniValue getborrower(const std::vector<std::string>& params, bool fHelp)
{
    if (fHelp || params.size() != 1) {
        throw std::runtime_error(
            "getborrower \"identity\"\n"
            "\nReturns the borrower account owned by identity.\n"
            "Balances are shown in their encrypted encoding.\n");
    }

    const uint256 owner = ParseAddress("identity", params[0]);
    BorrowerAccount account;
    if (!LedgerDB().ReadBorrower(owner, account)) {
        throw std::runtime_error("No borrower account for " + owner.GetHex());
    }
    return BorrowerToJSON(account);
}

static UniValue getdelegation(const std::vector<std::string>& params, bool fHelp)
{
    if (fHelp || params.size() != 1) {
        throw std::runtime_error(
            "getdelegation \"address\"\n"
            "\nReturns the delegated credit line stored at address.\n");
    }

    const uint256 address = ParseAddress("address", params[0]);
    DelegatedBorrower delegation;
    if (!LedgerDB().ReadDelegation(address, delegation)) {
        throw std::runtime_error("No delegation at " + address.GetHex());
    }
    return DelegationToJSON(delegation);
}

static UniValue getreputation(const std::vector<std::string>& params, bool fHelp)
{
    if (fHelp || params.size() != 1) {
        throw std::runtime_error(
            "getreputation \"identity\"\n"
            "\nReturns the stored reputation score of identity.\n");
    }

    const uint256 borrower = ParseAddress("identity", params[0]);
    BorrowerReputation reputation;
    if (!LedgerDB().ReadReputation(borrower, reputation)) {
        throw std::runtime_error("No reputation for " + borrower.GetHex());
    }
    return ReputationToJSON(reputation);
}

static UniValue listborrowers(const std::vector<std::string>& params, bool fHelp)
{
    if (fHelp || params.size() != 0) {
        throw std::runtime_error(
            "listborrowers\n"
            "\nLists every borrower account in key order.\n");
    }

    UniValue result(UniValue::VARR);
    LedgerDB().ForEachBorrower([&result](const BorrowerAccount& account) {
        result.push_back(BorrowerToJSON(account));
        return true;
    });
    return result;
}

// =============================================================================
// Governance
// =============================================================================

static UniValue getgovernance(const std::vector<std::string>& params, bool fHelp)
{
    if (fHelp || params.size() != 1) {
        throw std::runtime_error(
            "getgovernance \"address\"\n"
            "\nReturns the live proposal and its vote tally.\n");
    }

    const uint256 address = ParseAddress("address", params[0]);
    Governance governance;
    if (!LedgerDB().ReadGovernance(address, governance)) {
        throw std::runtime_error("No governance record at " + address.GetHex());
    }
    return GovernanceToJSON(governance);
}

// =============================================================================
// Transactions
// =============================================================================

static UniValue decodelendtx(const std::vector<std::string>& params, bool fHelp)
{
    if (fHelp || params.size() != 1) {
        throw std::runtime_error(
            "decodelendtx \"hexstring\"\n"
            "\nDecodes a serialized lending transaction without applying it.\n");
    }

    if (!IsHex(params[0])) {
        throw std::runtime_error("hexstring must be hexadecimal");
    }
    CLendTx tx;
    try {
        CDataStream ssTx(ParseHex(params[0]), SER_NETWORK, CLIENT_VERSION);
        ssTx >> tx;
    } catch (const std::exception& e) {
        throw std::runtime_error(strprintf("TX decode failed: %s", e.what()));
    }

    UniValue result(UniValue::VOBJ);
    LendTxToUniv(tx, result);
    std::string strError;
    result.pushKV("trivially_valid", tx.IsTriviallyValid(strError));
    if (!strError.empty()) {
        result.pushKV("reject_reason", strError);
    }
    return result;
}

static const CLICommand commands[] = {
    //  category      name                    actor                  argNames
    //  ------------  ----------------------  ---------------------  ----------
    { "protocol",     "getprotocol",          &getprotocol,          {"address"} },
    { "protocol",     "gettreasury",          &gettreasury,          {"address"} },
    { "pools",        "getlendingpool",       &getlendingpool,       {"address"} },
    { "pools",        "getcollateralpool",    &getcollateralpool,    {"address"} },
    { "pools",        "getinstitutionalpool", &getinstitutionalpool, {"address"} },
    { "borrowers",    "getborrower",          &getborrower,          {"identity"} },
    { "borrowers",    "getdelegation",        &getdelegation,        {"address"} },
    { "borrowers",    "getreputation",        &getreputation,        {"identity"} },
    { "borrowers",    "listborrowers",        &listborrowers,        {} },
    { "governance",   "getgovernance",        &getgovernance,        {"address"} },
    { "util",         "decodelendtx",         &decodelendtx,         {"hexstring"} },
};

static const CLICommand* FindCommand(const std::string& strMethod)
{
    for (const CLICommand& cmd : commands) {
        if (cmd.name == strMethod) return &cmd;
    }
    return nullptr;
}

static std::string CommandListHelp()
{
    std::string strRet;
    std::string category;
    for (const CLICommand& cmd : commands) {
        if (cmd.category != category) {
            category = cmd.category;
            strRet += "\n== " + category + " ==\n";
        }
        strRet += cmd.name;
        for (const std::string& arg : cmd.argNames) {
            strRet += " <" + arg + ">";
        }
        strRet += "\n";
    }
    return strRet;
}

//////////////////////////////////////////////////////////////////////////////
//
// Start
//

static int AppInitCLI(int argc, char* argv[])
{
    std::string error;
    if (!gArgs.ParseParameters(argc, argv, error)) {
        fprintf(stderr, "Error parsing command line arguments: %s\n", error.c_str());
        return EXIT_FAILURE;
    }

    if (argc < 2 || gArgs.IsArgSet("-?") || gArgs.IsArgSet("-h") || gArgs.IsArgSet("-help")) {
        std::string strUsage = strprintf("ZKLend ledger inspector v%d.%d.%d\n\n",
                                         CLIENT_VERSION_MAJOR, CLIENT_VERSION_MINOR, CLIENT_VERSION_REVISION);
        strUsage += "Usage:  zklend-cli [options] <command> [params]\n";
        strUsage += "or:     zklend-cli [options] help <command>\n\n";
        strUsage += GetLendingHelpString(gArgs.GetBoolArg("-help-debug", false));
        strUsage += "Commands:\n" + CommandListHelp();
        fprintf(stdout, "%s", strUsage.c_str());
        if (argc < 2) {
            fprintf(stderr, "Error: too few parameters\n");
            return EXIT_FAILURE;
        }
        return EXIT_SUCCESS;
    }

    if (!fs::is_directory(GetDataDir())) {
        fprintf(stderr, "Error: Specified data directory \"%s\" does not exist.\n", gArgs.GetArg("-datadir", "").c_str());
        return EXIT_FAILURE;
    }
    if (!gArgs.ReadConfigFile(gArgs.GetArg("-conf", ZKLEND_CONF_FILENAME), error)) {
        fprintf(stderr, "Error reading configuration file: %s\n", error.c_str());
        return EXIT_FAILURE;
    }

    // Read-only tool: never wipe, never write debug.log unless asked
    gArgs.ForceSetArg("-reindexlending", "0");
    gArgs.SoftSetBoolArg("-debuglogfile", false);

    if (!InitLogging(error)) {
        fprintf(stderr, "Error: %s\n", error.c_str());
        return EXIT_FAILURE;
    }
    return CONTINUE_EXECUTION;
}

static int CommandLineCLI(int argc, char* argv[])
{
    // First non-option argument is the command
    int nArg = 1;
    while (nArg < argc && argv[nArg][0] == '-') {
        nArg++;
    }
    if (nArg >= argc) {
        fprintf(stderr, "Error: too few parameters\n");
        return EXIT_FAILURE;
    }

    std::string strMethod(argv[nArg]);
    std::vector<std::string> params(&argv[nArg + 1], &argv[argc]);
    bool fHelp = false;
    if (strMethod == "help") {
        if (params.empty()) {
            fprintf(stdout, "%s", CommandListHelp().c_str());
            return EXIT_SUCCESS;
        }
        strMethod = params[0];
        params.clear();
        fHelp = true;
    }

    const CLICommand* pcmd = FindCommand(strMethod);
    if (!pcmd) {
        fprintf(stderr, "error: Method not found: %s\n", strMethod.c_str());
        return EXIT_FAILURE;
    }

    std::string error;
    if (!fHelp && !InitLending(error)) {
        fprintf(stderr, "error: %s\n", error.c_str());
        return EXIT_FAILURE;
    }

    int nRet = EXIT_SUCCESS;
    try {
        const UniValue result = pcmd->actor(params, fHelp);
        fprintf(stdout, "%s\n", result.isStr() ? result.get_str().c_str() : result.write(2).c_str());
    } catch (const dbwrapper_error& e) {
        fprintf(stderr, "error: database: %s\n", e.what());
        nRet = EXIT_FAILURE;
    } catch (const std::runtime_error& e) {
        // Help text and user errors both arrive here
        fprintf(fHelp ? stdout : stderr, "%s%s\n", fHelp ? "" : "error: ", e.what());
        nRet = fHelp ? EXIT_SUCCESS : EXIT_FAILURE;
    }

    ShutdownLending();
    return nRet;
}

int main(int argc, char* argv[])
{
    try {
        int ret = AppInitCLI(argc, argv);
        if (ret != CONTINUE_EXECUTION)
            return ret;
    } catch (const std::exception& e) {
        fprintf(stderr, "Error: %s\n", e.what());
        return EXIT_FAILURE;
    }

    int ret = EXIT_FAILURE;
    try {
        ret = CommandLineCLI(argc, argv);
    } catch (const std::exception& e) {
        fprintf(stderr, "Error: %s\n", e.what());
    }
    return ret;
}
