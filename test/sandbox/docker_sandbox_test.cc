#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>

#include "common/errors.h"
#include "mocks.h"
#include "sandbox/docker_sandbox.h"

using namespace PatchArbiter;

/**
 * DockerSandbox against a stand-in `docker` script that records its
 * arguments, prints a container id for `run` and hands `exec -it` over to a
 * local bash.
 */
class DockerSandboxTest : public ::testing::Test {
protected:
    void SetUp() override {
        log_ = dir_.Sub("docker.log");
        docker_ = dir_.Sub("docker");
        std::ofstream script(docker_);
        script << "#!/bin/sh\n"
               << "echo \"$@\" >> " << log_ << "\n"
               << "case \"$1\" in\n"
               << "  run) echo 'Unable to find image locally'; echo 0123456789abcdef0123 ;;\n"
               << "  exec)\n"
               << "    if [ \"$2\" = \"-it\" ]; then shift 3; exec \"$@\" --norc --noprofile; fi\n"
               << "    shift 2\n"
               << "    if [ \"$1\" = \"pwd\" ]; then echo /testbed; fi ;;\n"
               << "esac\n"
               << "exit 0\n";
        script.close();
        std::filesystem::permissions(docker_, std::filesystem::perms::owner_all);
        std::filesystem::create_directories(dir_.Sub("tools"));

        options_.docker_binary = docker_;
        options_.tools_path = dir_.Sub("tools");
        options_.docker_timeout = std::chrono::seconds(10);

        instance_.instance_id = "astropy__astropy-12907";
        instance_.base_commit = "d16bfe05a7";
    }

    std::string Calls() {
        std::ifstream in(log_);
        std::stringstream buffer;
        buffer << in.rdbuf();
        return buffer.str();
    }

    TempDir dir_;
    std::string log_;
    std::string docker_;
    DockerSandboxOptions options_;
    Instance instance_;
};

TEST_F(DockerSandboxTest, ImageName) {
    DockerSandboxOptions options;
    EXPECT_EQ(ImageNameFor("astropy__astropy-12907", options),
            "swebench/sweb.eval.x86_64.astropy_1776_astropy-12907:latest");
    options.image_tag = "v2";
    EXPECT_EQ(ImageNameFor("plain-1", options), "swebench/sweb.eval.x86_64.plain-1:v2");
}

TEST_F(DockerSandboxTest, StartProvisionsAndStopRemoves) {
    {
        DockerSandbox sandbox(instance_, options_);
        sandbox.Start();
        EXPECT_EQ(sandbox.container_id(), "0123456789abcdef0123");
        EXPECT_EQ(sandbox.Name(), "0123456789ab");
        EXPECT_EQ(sandbox.ProjectPath(), "/testbed");
        sandbox.Stop();
        EXPECT_TRUE(sandbox.container_id().empty());
        sandbox.Stop();
    }
    std::string calls = Calls();
    EXPECT_NE(calls.find("run -d -t -i --privileged -v /tmp:/tmp swebench/sweb.eval.x86_64.astropy_1776_astropy-12907:latest"),
            std::string::npos) << calls;
    EXPECT_NE(calls.find("cp " + options_.tools_path + " 0123456789abcdef0123:/home/swe-bench/"),
            std::string::npos) << calls;
    EXPECT_NE(calls.find("exec 0123456789abcdef0123 git checkout d16bfe05a7"), std::string::npos);
    EXPECT_NE(calls.find("stop 0123456789abcdef0123"), std::string::npos);
    EXPECT_NE(calls.find("rm 0123456789abcdef0123"), std::string::npos);
}

TEST_F(DockerSandboxTest, DestructorStopsContainer) {
    {
        DockerSandbox sandbox(instance_, options_);
        sandbox.Start();
    }
    EXPECT_NE(Calls().find("stop 0123456789abcdef0123"), std::string::npos);
}

TEST_F(DockerSandboxTest, SessionRunsInsideContainerShell) {
    DockerSandbox sandbox(instance_, options_);
    sandbox.Start();
    std::unique_ptr<IShellSession> session = sandbox.OpenSession();
    ShellOutput out = session->Execute("echo inside", std::chrono::seconds(10));
    EXPECT_EQ(out.text, "inside");
    session->Close();
    EXPECT_NE(Calls().find("exec -it 0123456789abcdef0123 /bin/bash"), std::string::npos);
}

TEST_F(DockerSandboxTest, FailedRunRaisesStartFailure) {
    options_.docker_binary = "false";
    DockerSandbox sandbox(instance_, options_);
    EXPECT_THROW(sandbox.Start(), SandboxStartFailure);
    sandbox.Stop();
}

TEST_F(DockerSandboxTest, SessionBeforeStartFails) {
    DockerSandbox sandbox(instance_, options_);
    EXPECT_THROW(sandbox.OpenSession(), ShellError);
}
