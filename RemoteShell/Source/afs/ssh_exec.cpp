// *****************************************************************************
// * This file is part of the RemoteShell project. It is distributed under     *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "ssh_exec.h"
#include <chrono>
#include <optional>
#include <exception>
#include <mutex>
#include <cstring> //strdup
#include <poll.h>
#include <zen/socket.h>
#include <zen/file_io.h>
#include <zen/open_ssl.h>
#include <libssh2/libssh2_wrap.h> //DON'T include <libssh2.h> directly!

using namespace zen;
using namespace rsh;


namespace
{
std::mutex initLevelLock;
int initLevel = 0; //support interleaving initialization calls!
}


void rsh::libssh2Init() //throw SysError
{
    std::lock_guard dummy(initLevelLock);
    assert(initLevel >= 0);
    if (++initLevel != 1)
        return;
    ZEN_ON_SCOPE_FAIL(--initLevel);

    openSslInit();

    //includes OpenSSL-related initialization which might be needed
    if (const int rc = ::libssh2_init(0);
        rc != 0)
    {
        openSslTearDown();
        throw SysError(formatSystemError("libssh2_init", formatSshStatusCode(rc), L""));
    }
}


void rsh::libssh2TearDown()
{
    std::lock_guard dummy(initLevelLock);
    assert(initLevel >= 1);
    if (--initLevel != 0)
        return;

    ::libssh2_exit();
    openSslTearDown();
}

//===========================================================================================================================

class SshShellExecutor::SshSession
{
public:
    explicit SshSession(const SftpLogin& login) : //throw SysError, SysErrorPassword
        login_(login)
    {
        ZEN_ON_SCOPE_FAIL(cleanup()); //destructor call would lead to member double clean-up!!!

        const int port = login_.portCfg > 0 ? login_.portCfg : DEFAULT_PORT_SFTP;

        socket_.emplace(login_.server, numberTo<Zstring>(port), login_.timeoutSec); //throw SysError

        sshSession_ = ::libssh2_session_init();
        if (!sshSession_) //does not set ssh last error; source: only memory allocation may fail
            throw SysError(formatSystemError("libssh2_session_init", formatSshStatusCode(LIBSSH2_ERROR_ALLOC), L""));

        if (login_.allowZlib)
            if (const int rc = ::libssh2_session_flag(sshSession_, LIBSSH2_FLAG_COMPRESS, 1);
                rc != 0) //does not set SSH last error
                throw SysError(formatSystemError("libssh2_session_flag", formatSshStatusCode(rc), L""));

        ::libssh2_session_set_blocking(sshSession_, 1);
        ::libssh2_session_set_timeout(sshSession_, login_.timeoutSec * 1000 /*ms*/);

        if (::libssh2_session_handshake(sshSession_, socket_->get()) != 0)
            throw SysError(formatLastSshError("libssh2_session_handshake"));

        authenticate(); //throw SysError, SysErrorPassword
    }

    ~SshSession() { cleanup(); }

    std::string runCommand(const std::string& command) //throw SysError, SysErrorExitCode
    {
        std::lock_guard dummy(lockSession_);

        LIBSSH2_CHANNEL* channel = ::libssh2_channel_open_session(sshSession_);
        if (!channel)
            throw SysError(formatLastSshError("libssh2_channel_open_session"));
        ZEN_ON_SCOPE_EXIT(::libssh2_channel_free(channel)); //no error handling: frees local resources only

        if (::libssh2_channel_exec(channel, command) != 0)
            throw SysError(formatLastSshError("libssh2_channel_exec"));

        std::string stdOut;
        std::string stdErr;
        readUntilEof(channel, stdOut, stdErr); //throw SysError

        if (::libssh2_channel_close(channel) != 0)
            throw SysError(formatLastSshError("libssh2_channel_close"));

        if (::libssh2_channel_wait_closed(channel) != 0)
            throw SysError(formatLastSshError("libssh2_channel_wait_closed"));

        //"0 if the exit status has not been reported": e.g. command killed by signal
        const int exitCode = ::libssh2_channel_get_exit_status(channel);
        if (exitCode != 0)
        {
            trim(stdErr);
            throw SysErrorExitCode(formatSystemError(command, replaceCpy(_("Exit code %x"), L"%x", numberTo<std::wstring>(exitCode)),
                                                     utfTo<std::wstring>(stdErr)), exitCode);
        }
        return stdOut;
    }

private:
    SshSession           (const SshSession&) = delete;
    SshSession& operator=(const SshSession&) = delete;

    void authenticate() //throw SysError, SysErrorPassword
    {
        const std::string& username = login_.username;
        const std::string& password = login_.password;

        const char* authList = ::libssh2_userauth_list(sshSession_, username);
        if (!authList)
        {
            if (::libssh2_userauth_authenticated(sshSession_) != 1)
                throw SysError(formatLastSshError("libssh2_userauth_list"));
            return; //SSH_USERAUTH_NONE has authenticated successfully => we're already done
        }

        bool supportAuthPassword    = false;
        bool supportAuthKeyfile     = false;
        bool supportAuthInteractive = false;
        split(authList, ',', [&](std::string_view authMethod)
        {
            authMethod = trimCpy(authMethod);
            if (authMethod == "password")
                supportAuthPassword = true;
            else if (authMethod == "publickey")
                supportAuthKeyfile = true;
            else if (authMethod == "keyboard-interactive")
                supportAuthInteractive = true;
        });

        auto throwAuthUnsupported = [&](const wchar_t* authName)
        {
            throw SysError(replaceCpy(_("The server does not support authentication via %x."), L"%x", authName) +
                           L'\n' + _("Required:") + L' ' + utfTo<std::wstring>(authList));
        };

        switch (login_.authType)
        {
            case SftpAuthType::password:
                if (supportAuthPassword)
                {
                    if (::libssh2_userauth_password(sshSession_, username, password) != 0)
                        throw SysErrorPassword(formatLastSshError("libssh2_userauth_password"));
                }
                else if (supportAuthInteractive) //some servers support "keyboard-interactive", but not "password"
                    authenticateInteractive(username, password); //throw SysError, SysErrorPassword
                else
                    throwAuthUnsupported(L"\"username/password\"");
                break;

            case SftpAuthType::keyFile:
            {
                if (!supportAuthKeyfile)
                    throwAuthUnsupported(L"\"key file\"");

                std::string pkStream;
                try
                {
                    pkStream = getFileContent(login_.privateKeyFilePath); //throw FileError
                    trim(pkStream);
                }
                catch (const FileError& e) { throw SysError(replaceCpy(e.toString(), L"\n\n", L"\n")); } //errors should be further enriched by context info => SysError

                if (::libssh2_userauth_publickey_frommemory(sshSession_, username, pkStream, password /*passphrase*/) != 0)
                {
                    //"Unable to extract public key from private key" isn't exactly *helpful*
                    const std::string_view firstLine(pkStream.data(), std::find_if(pkStream.begin(), pkStream.end(), isLineBreak<char>) - pkStream.begin());
                    if (contains(firstLine, "PUBLIC KEY") || startsWith(pkStream, "ssh-") || startsWith(pkStream, "ecdsa-"))
                        throw SysError(_("Authentication failed.") + L' ' +
                                       replaceCpy<std::wstring>(L"%x is not an OpenSSH private key file.", L"%x", fmtPath(login_.privateKeyFilePath)));

                    throw SysErrorPassword(formatLastSshError("libssh2_userauth_publickey_frommemory"));
                }
            }
            break;

            case SftpAuthType::agent:
            {
                LIBSSH2_AGENT* sshAgent = ::libssh2_agent_init(sshSession_);
                if (!sshAgent)
                    throw SysError(formatLastSshError("libssh2_agent_init"));
                ZEN_ON_SCOPE_EXIT(::libssh2_agent_free(sshAgent));

                if (::libssh2_agent_connect(sshAgent) != 0)
                    throw SysError(formatLastSshError("libssh2_agent_connect"));
                ZEN_ON_SCOPE_EXIT(::libssh2_agent_disconnect(sshAgent));

                if (::libssh2_agent_list_identities(sshAgent) != 0)
                    throw SysError(formatLastSshError("libssh2_agent_list_identities"));

                for (libssh2_agent_publickey* prev = nullptr;;)
                {
                    libssh2_agent_publickey* identity = nullptr;
                    const int rc = ::libssh2_agent_get_identity(sshAgent, &identity, prev);
                    if (rc == 0) //public key returned
                        ;
                    else if (rc == 1) //no more public keys
                        throw SysError(L"SSH agent contains no matching public key.");
                    else
                        throw SysError(formatLastSshError("libssh2_agent_get_identity"));

                    if (::libssh2_agent_userauth(sshAgent, username.c_str(), identity) == 0)
                        break; //authentication successful

                    //else: failed => try next public key
                    prev = identity;
                }
            }
            break;
        }
    }

    void authenticateInteractive(const std::string& username, const std::string& password) //throw SysError, SysErrorPassword
    {
        std::wstring unexpectedPrompts;
        std::exception_ptr callbackError; //don't let exceptions pass through the C API

        auto authCallback = [&](int num_prompts, const LIBSSH2_USERAUTH_KBDINT_PROMPT* prompts, LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses)
        {
            //single prompt without echo: assume password request; the prompt text may be localized
            if (num_prompts == 1 && prompts[0].echo == 0)
            {
                responses[0].text = ::strdup(password.c_str()); //pass ownership; will be ::free()d
                responses[0].length = static_cast<unsigned int>(password.size());
            }
            else
                for (int i = 0; i < num_prompts; ++i)
                    unexpectedPrompts += (unexpectedPrompts.empty() ? L"" : L"|") +
                                         utfTo<std::wstring>(std::string_view(reinterpret_cast<const char*>(prompts[i].text), prompts[i].length));
        };
        using AuthCbType = decltype(authCallback);
        using CallbackContext = std::pair<AuthCbType*, std::exception_ptr*>;

        auto authCallbackWrapper = [](const char* name, int name_len, const char* instruction, int instruction_len,
                                      int num_prompts, const LIBSSH2_USERAUTH_KBDINT_PROMPT* prompts, LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses, void** abstract)
        {
            CallbackContext& ctx = **reinterpret_cast<CallbackContext**>(abstract);
            try
            {
                (*ctx.first)(num_prompts, prompts, responses); //name, instruction may be nullptr
            }
            catch (...) { *ctx.second = std::current_exception(); } //rethrown below
        };

        if (*::libssh2_session_abstract(sshSession_))
            throw SysError(L"libssh2_session_abstract: non-null value");

        CallbackContext ctx(&authCallback, &callbackError);
        *reinterpret_cast<CallbackContext**>(::libssh2_session_abstract(sshSession_)) = &ctx;
        ZEN_ON_SCOPE_EXIT(*::libssh2_session_abstract(sshSession_) = nullptr);

        const int rc = ::libssh2_userauth_keyboard_interactive(sshSession_, username, authCallbackWrapper);

        if (callbackError)
            std::rethrow_exception(callbackError);

        if (rc != 0)
            throw SysErrorPassword(formatLastSshError("libssh2_userauth_keyboard_interactive") +
                                   (unexpectedPrompts.empty() ? L"" : L"\nUnexpected prompts: " + unexpectedPrompts));
    }

    //drain stdout and stderr concurrently: a full stderr window must not stall reading stdout
    void readUntilEof(LIBSSH2_CHANNEL* channel, std::string& stdOut, std::string& stdErr) //throw SysError
    {
        ::libssh2_session_set_blocking(sshSession_, 0);
        ZEN_ON_SCOPE_EXIT(::libssh2_session_set_blocking(sshSession_, 1));

        //inactivity timeout: commands may run long as long as they keep talking
        auto lastActivity = std::chrono::steady_clock::now();

        for (;;)
        {
            const bool gotOut = readAvailable(channel, 0, stdOut);                         //throw SysError
            const bool gotErr = readAvailable(channel, SSH_EXTENDED_DATA_STDERR, stdErr); //

            if (gotOut || gotErr)
                lastActivity = std::chrono::steady_clock::now();
            else if (::libssh2_channel_eof(channel) == 1)
                return;
            else
                waitForTraffic(lastActivity); //throw SysError
        }
    }

    //return "true" if data was read
    bool readAvailable(LIBSSH2_CHANNEL* channel, int streamId, std::string& output) //throw SysError
    {
        bool gotData = false;
        char buffer[32 * 1024];
        for (;;)
        {
            const ssize_t rc = ::libssh2_channel_read_ex(channel, streamId, buffer, sizeof(buffer));
            if (rc > 0)
            {
                output.append(buffer, rc);
                gotData = true;
            }
            else if (rc == 0 || rc == LIBSSH2_ERROR_EAGAIN)
                return gotData;
            else
                throw SysError(formatLastSshError("libssh2_channel_read_ex"));
        }
    }

    //returns when traffic is available or throws on time out
    void waitForTraffic(std::chrono::steady_clock::time_point lastActivity) //throw SysError
    {
        const auto now = std::chrono::steady_clock::now();
        const auto stopTime = lastActivity + std::chrono::seconds(login_.timeoutSec);
        if (now >= stopTime)
            throw SysError(formatSystemError("libssh2_channel_read_ex", formatSshStatusCode(LIBSSH2_ERROR_TIMEOUT),
                                             _P("Operation timed out after 1 second.", "Operation timed out after %x seconds.", login_.timeoutSec)));

        //reference: session.c: _libssh2_wait_socket()
        pollfd pfd{.fd = socket_->get()};

        const int dir = ::libssh2_session_block_directions(sshSession_);
        if (dir & LIBSSH2_SESSION_BLOCK_INBOUND)
            pfd.events |= POLLIN;
        if (dir & LIBSSH2_SESSION_BLOCK_OUTBOUND)
            pfd.events |= POLLOUT;
        if (pfd.events == 0)
            pfd.events = POLLIN;

        const int waitTimeMs = static_cast<int>(std::chrono::duration_cast<std::chrono::milliseconds>(stopTime - now).count());

        if (::poll(&pfd, 1, waitTimeMs) < 0 && errno != EINTR)
            THROW_LAST_SYS_ERROR("poll");
        //time out is checked on next call
    }

    void cleanup() //attention: may block heavily after error!
    {
        if (sshSession_)
        {
            //server notification only! no local cleanup apparently
            if (::libssh2_session_disconnect(sshSession_, "RemoteShell says \"bye\"!") != LIBSSH2_ERROR_NONE)
                logExtraWarning(formatLastSshError("libssh2_session_disconnect"));

            if (::libssh2_session_free(sshSession_) != LIBSSH2_ERROR_NONE)
                logExtraWarning(formatSystemError("libssh2_session_free", L"", L""));
        }
    }

    std::wstring formatLastSshError(const char* functionName) const
    {
        char* lastErrorMsg = nullptr; //owned by "sshSession"
        const int sshStatusCode = ::libssh2_session_last_error(sshSession_, &lastErrorMsg, nullptr, false /*want_buf*/);

        std::wstring errorMsg;
        if (lastErrorMsg)
            errorMsg = trimCpy(utfTo<std::wstring>(lastErrorMsg));

        return formatSystemError(functionName, formatSshStatusCode(sshStatusCode), errorMsg);
    }

    const SftpLogin login_;
    std::optional<Socket> socket_; //*bound* after constructor has run
    LIBSSH2_SESSION* sshSession_ = nullptr;
    std::mutex lockSession_;
};

//===========================================================================================================================

SshShellExecutor::SshShellExecutor(const SftpLogin& login) : session_(std::make_unique<SshSession>(login)) {} //throw SysError, SysErrorPassword

SshShellExecutor::~SshShellExecutor() {}


std::string SshShellExecutor::runCommand(const std::string& command) //throw SysError, SysErrorExitCode
{
    return session_->runCommand(command); //throw SysError, SysErrorExitCode
}
