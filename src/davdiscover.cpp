/*
 * Copyright (C) 2026 The davdiscover authors
 *
 * This library is free software; you can redistribute it and/or
 * modify it under the terms of the GNU Lesser General Public
 * License as published by the Free Software Foundation; either
 * version 2.1 of the License, or (at your option) version 3.
 *
 * This library is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the GNU
 * Lesser General Public License for more details.
 *
 * You should have received a copy of the GNU Lesser General Public
 * License along with this library; if not, write to the Free Software
 * Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston, MA
 * 02110-1301  USA
 */

#include "config.h"

#include <davdiscover/Logging.h>
#include <davdiscover/LogStdout.h>
#include <davdiscover/Exception.h>
#include <davdiscover/IniConfigNode.h>
#include <davdiscover/FileDataBlob.h>
#include <davdiscover/util.h>

#include "ResourceFinder.h"
#include "DiscoverySettings.h"
#include "DAVClient.h"
#include "DNSResolver.h"

#include <glib.h>
#include <stdio.h>

#include <boost/shared_ptr.hpp>

using namespace DavDiscover;

namespace {
    const char * const execName = "davdiscover";

int usage(GOptionContext *context, const std::string &error)
{
    boost::shared_ptr<gchar> help(g_option_context_get_help(context, TRUE, NULL), g_free);
    fprintf(stderr, "%s: %s\n\n%s", execName, error.c_str(), help.get());
    return 2;
}

/** gchar * filled in by GOption, freed automatically */
class OptionString
{
 public:
    gchar *m_value;
    OptionString() : m_value(NULL) {}
    ~OptionString() { g_free(m_value); }
    operator bool () const { return m_value != NULL; }
    std::string get() const { return m_value ? m_value : ""; }
};

} // anonymous namespace

int main(int argc, char **argv)
{
    g_log_set_default_handler(Logger::glogFunc, NULL);

    // progress and errors go to stderr, the result to stdout
    PushLogger<LoggerStdout> logger(new LoggerStdout(stderr));
    logger->setLevel(Logger::WARNING);

    OptionString configFile, user, password, logLevel, saveFile;
    gboolean preemptive = false;
    gboolean parallel = false;
    gboolean version = false;
    int timeout = 0;
    GOptionEntry entries[] = {
        { "config", 'c', 0, G_OPTION_ARG_FILENAME, &configFile.m_value, "Read settings from this .ini file", "file" },
        { "user", 'u', 0, G_OPTION_ARG_STRING, &user.m_value, "Username for the server", "name" },
        { "password", 'p', 0, G_OPTION_ARG_STRING, &password.m_value, "Password for the server", "pw" },
        { "preemptive", 0, 0, G_OPTION_ARG_NONE, &preemptive, "Send credentials without waiting for the server to ask", NULL },
        { "parallel", 0, 0, G_OPTION_ARG_NONE, &parallel, "Discover CalDAV and CardDAV at the same time", NULL },
        { "timeout", 't', 0, G_OPTION_ARG_INT, &timeout, "Seconds until a request fails, default 60", "seconds" },
        { "log-level", 'l', 0, G_OPTION_ARG_STRING, &logLevel.m_value,
          "Amount of output on stderr: ERROR, WARNING, INFO, DEV or DEBUG; default is WARNING", "level" },
        { "save", 's', 0, G_OPTION_ARG_FILENAME, &saveFile.m_value, "Store the result in this .ini file", "file" },
        { "version", 0, 0, G_OPTION_ARG_NONE, &version, "Print the version and quit", NULL },
        { NULL }
    };
    boost::shared_ptr<GOptionContext> context(g_option_context_new("<https-url|http-url|mailto:address> - find CalDAV and CardDAV servers"),
                                              g_option_context_free);
    g_option_context_add_main_entries(context.get(), entries, NULL);
    GError *gerror = NULL;
    if (!g_option_context_parse(context.get(), &argc, &argv, &gerror)) {
        std::string error = gerror->message;
        g_clear_error(&gerror);
        return usage(context.get(), error);
    }
    if (version) {
        printf("%s %s\n", PACKAGE, VERSION);
        return 0;
    }
    if (argc != 2) {
        return usage(context.get(), "exactly one URL or email address expected");
    }
    if (logLevel) {
        // strToLevel() falls back to DEBUG for unknown names
        Logger::Level level = Logger::strToLevel(logLevel.get().c_str());
        if (!boost::iequals(logLevel.get(), Logger::levelToStr(level)) &&
            !boost::iequals(logLevel.get(), "DEV")) {
            return usage(context.get(), StringPrintf("invalid log level '%s'", logLevel.get().c_str()));
        }
        logger->setLevel(level);
    }
    if (timeout < 0) {
        return usage(context.get(), "timeout must not be negative");
    }

    try {
        boost::shared_ptr<DiscoverySettings> settings(new DiscoverySettings);
        if (configFile) {
            IniHashConfigNode node(std::make_shared<FileDataBlob>(configFile.get(), true));
            if (!node.exists()) {
                DD_THROW(StringPrintf("%s: no such file", configFile.get().c_str()));
            }
            settings->load(node);
        }
        if (user) {
            settings->m_username = user.get();
        }
        if (password) {
            settings->m_password = password.get();
        }
        if (preemptive) {
            settings->m_preemptive = true;
        }
        if (parallel) {
            settings->m_parallel = true;
        }
        if (timeout) {
            settings->m_timeout = timeout;
        }

        ResourceFinder finder(settings,
                              [settings] (const Logger::Handle &log) {
                                  return boost::shared_ptr<DAVClient>(new NeonDAVClient(settings, log));
                              },
                              [] (const Logger::Handle &) {
                                  return boost::shared_ptr<DNSResolver>(new ResolvDNSResolver);
                              });
        Configuration config = finder.findInitialConfiguration(argv[1]);
        fputs(config.toString().c_str(), stdout);

        if (saveFile) {
            IniHashConfigNode node(std::make_shared<FileDataBlob>(saveFile.get(), false));
            config.save(node);
            node.flush();
        }

        if (!config.isUseful()) {
            printf("\nneither CalDAV nor CardDAV found, log of the discovery:\n%s", config.m_logs.c_str());
            return 1;
        }
        return 0;
    } catch (...) {
        Exception::handle();
        return 1;
    }
}
