/*
 * Copyright (C) 2009 Patrick Ohly <patrick.ohly@gmx.de>
 * Copyright (C) 2009 Intel Corporation
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

/** @cond API */
/** @addtogroup ClientTest */
/** @{ */

#include "config.h"

#include "test.h"

#include <signal.h>
#ifdef HAVE_EXECINFO_H
# include <execinfo.h>
#endif

#include <cppunit/CompilerOutputter.h>
#include <cppunit/ui/text/TestRunner.h>
#include <cppunit/TestListener.h>
#include <cppunit/TestResult.h>
#include <cppunit/TestFailure.h>
#include <cppunit/TestResultCollector.h>
#include <cppunit/extensions/TestFactoryRegistry.h>
#include <cppunit/extensions/HelperMacros.h>

#include <davdiscover/Logging.h>
#include <davdiscover/LogStdout.h>
#include <davdiscover/util.h>

#include <stdlib.h>
#include <stdio.h>
#include <string.h>
#include <unistd.h>

#include <sys/types.h>
#include <sys/wait.h>

#include <iostream>
#include <list>
#include <sstream>
#include <string>
#include <stdexcept>

#include <davdiscover/declarations.h>
DD_BEGIN_CXX

class ClientOutputter : public CppUnit::CompilerOutputter {
public:
    ClientOutputter(CppUnit::TestResultCollector *result, std::ostream &stream) :
        CompilerOutputter(result, stream) {}
    void write() {
        // Suppress writing useless test summary. We run only one test per process,
        // so this Outputter would not show the overall results.
    }
};

class ClientListener : public CppUnit::TestListener {
public:
    ClientListener() :
        m_failed(false),
        m_testFailed(false)
    {
        // install signal handler which turns an alarm signal into a runtime exception
        // to abort tests which run too long
        const char *alarm = getenv("CLIENT_TEST_ALARM");
        m_alarmSeconds = alarm ? atoi(alarm) : -1;

        struct sigaction action;
        memset(&action, 0, sizeof(action));
        action.sa_handler = alarmTriggered;
        action.sa_flags = SA_NODEFER;
        sigaction(SIGALRM, &action, NULL);
    }

    ~ClientListener() {
        m_logger.reset();
    }

    void startTest (CppUnit::Test *test) {
        m_currentTest = test->getName();
        std::cout << m_currentTest << std::flush;
        if (!getenv("DAVDISCOVER_DEBUG")) {
            std::string logfile = m_currentTest + ".log";
            simplifyFilename(logfile);
            m_logger.reset(new LoggerStdout(logfile));
            m_logger->setLevel(Logger::DEBUG);
        }
        DD_LOG_DEBUG(NULL, "*** starting %s ***", m_currentTest.c_str());
        m_failures.reset();
        m_testFailed = false;

        if (m_alarmSeconds > 0) {
            alarm(m_alarmSeconds);
        }
    }

    void addFailure(const CppUnit::TestFailure &failure) {
        m_failures.addFailure(failure);
        m_testFailed = true;
    }

    void endTest (CppUnit::Test *test) {
        if (m_alarmSeconds > 0) {
            alarm(0);
        }

        std::string result;
        std::string failure;
        if (m_testFailed) {
            std::stringstream output;
            CppUnit::CompilerOutputter formatter(&m_failures, output);
            formatter.printFailureReport();
            failure = output.str();
            result = "*** failed ***";
            m_failed = true;
        } else {
            result = "okay";
        }

        DD_LOG_DEBUG(NULL, "*** ending %s: %s ***", m_currentTest.c_str(), result.c_str());
        if (!failure.empty()) {
            DD_LOG_ERROR(NULL, "%s", failure.c_str());
        }
        m_logger.reset();

        std::cout << " " << result << "\n";
        if (!failure.empty()) {
            std::cout << failure << "\n";
        }
        std::cout << std::flush;
    }

    bool hasFailed() { return m_failed; }
    const std::string &getCurrentTest() const { return m_currentTest; }

private:
    bool m_failed, m_testFailed;
    std::string m_currentTest;
    int m_alarmSeconds;
    PushLogger<LoggerStdout> m_logger;
    CppUnit::TestResultCollector m_failures;

    static void alarmTriggered(int signal) {
        CPPUNIT_ASSERT_MESSAGE("test timed out", false);
    }
} testListener;

static void printTests(CppUnit::Test *test, int indention)
{
    if (!test) {
        return;
    }

    std::string name = test->getName();
    printf("%*s%s\n", indention * 3, "", name.c_str());
    for (int i = 0; i < test->getChildTestCount(); i++) {
        printTests(test->getChildTestAt(i), indention+1);
    }
}

static void addEnabledTests(CppUnit::Test *test, bool parentEnabled,
                            char **beginEnabled, char **endEnabled,
                            std::list<std::string> &result)
{
    if (!test) {
        return;
    }

    std::string name = test->getName();
    bool enabled = false;
    if (parentEnabled) {
        enabled = true;
    } else {
        for (char **selected = beginEnabled;
             selected < endEnabled;
             selected++) {
            if (name == *selected) {
                enabled = true;
                break;
            }
        }
    }

    if (dynamic_cast<CppUnit::TestLeaf *>(test)) {
        if (enabled) {
            result.push_back(name);
        }
    } else {
        for (int i = 0; i < test->getChildTestCount(); i++) {
            addEnabledTests(test->getChildTestAt(i), enabled,
                            beginEnabled, endEnabled,
                            result);
        }
    }
}

static void handler(int sig)
{
    fprintf(stderr, "client-test %ld: \ncaught signal %d\n", (long)getpid(), sig);
    fflush(stderr);
#ifdef HAVE_EXECINFO_H
    void *buffer[100];
    int size = backtrace(buffer, sizeof(buffer)/sizeof(buffer[0]));
    backtrace_symbols_fd(buffer, size, 2);
#endif
    struct sigaction act;
    memset(&act, 0, sizeof(act));
    act.sa_handler = SIG_DFL;
    sigaction(SIGABRT, &act, NULL);
    abort();
}

static int runTests(int argc, char* argv[])
{
    struct sigaction act;

    memset(&act, 0, sizeof(act));
    act.sa_handler = handler;
    sigaction(SIGABRT, &act, NULL);
    sigaction(SIGSEGV, &act, NULL);
    sigaction(SIGILL, &act, NULL);

    // Get the top level suite from the registry
    CppUnit::Test *suite = CppUnit::TestFactoryRegistry::getRegistry().makeTest();

    if (argc >= 2 && (!strcmp(argv[1], "-h") || !strcmp(argv[1], "--help"))) {
        printf("usage: %s [test name]+\n\n"
               "Without arguments all available tests are run.\n"
               "Otherwise only the tests or group of tests listed are run.\n"
               "Here is the test hierarchy of this test program:\n",
               argv[0]);
        printTests(suite, 1);
        return 0;
    }

    // Adds the test to the list of test to run
    CppUnit::TextUi::TestRunner runner;
    runner.addTest( suite );

    // Change the default outputter to a compiler error format outputter
    runner.setOutputter( new ClientOutputter( &runner.result(),
                                              std::cout ) );

    // track current test and failure state
    runner.eventManager().addListener(&testListener);

    if (getenv("DAVDISCOVER_DEBUG")) {
        Logger::instance().setLevel(Logger::DEBUG);
    }

    try {
        // Find all enabled tests.
        std::list<std::string> tests;
        if (argc <= 1) {
            // All tests.
            addEnabledTests(suite, true, NULL, NULL, tests);
        } else {
            // Some selected tests.
            addEnabledTests(suite, false, argv + 1, argv + argc, tests);
        }

        bool failed = false;
        if (tests.size() == 1) {
            // If one test, run it ourselves.
            runner.run(tests.front(), false, true, false);
            failed = testListener.hasFailed();
        } else {
            // Otherwise act as test runner which invokes itself
            // recursively for each test. This way we keep running
            // even if one test crashes hard and each test gets its
            // own process.
            for (const std::string &name: tests) {
                pid_t child = fork();
                if (child > 0) {
                    int status;
                    pid_t completed = waitpid(child, &status, 0);
                    if (completed == -1) {
                        perror("waitpid");
                        failed = true;
                    } else if (WIFEXITED(status)) {
                        int retcode = WEXITSTATUS(status);
                        if (retcode != 0) {
                            printf("%s (%ld): failed with return code %d\n", name.c_str(), (long)child, retcode);
                            failed = true;
                        }
                    } else if (WIFSIGNALED(status)) {
                        printf("%s (%ld): killed by signal %d\n", name.c_str(), (long)child, WTERMSIG(status));
                        failed = true;
                    }
                    fflush(stdout);
                } else if (child == -1) {
                    perror("fork");
                    failed = true;
                } else {
                    execl("/proc/self/exe", argv[0], name.c_str(), (char *)NULL);
                    perror("execl");
                    _exit(1);
                }
            }
        }

        // Return error code 1 if the one of test failed.
        if (tests.size() > 1) {
            printf("%s\n", failed ? "FAILED" : "OK");
        }
        return failed;
    } catch (const std::invalid_argument &e) {
        // Test path not resolved
        std::cout << std::endl
                  << "ERROR: " << e.what()
                  << std::endl;
        return 1;
    }
}

DD_END_CXX

int main(int argc, char* argv[])
{
    return DavDiscover::runTests(argc, argv);
}

/** @} */
/** @endcond */
