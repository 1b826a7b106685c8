/**
 * @file ProtocolClassifierTest.cpp
 * @brief Unit tests for locator classification and path helpers
 */

#include <gtest/gtest.h>

#include <atomic>
#include <thread>
#include <vector>

#include "services/ProtocolClassifier.hpp"

TEST(ProtocolClassifierTest, Classify_RecognizesEveryScheme) {
    EXPECT_EQ(protocol::classify("smb://nas/share/a.jpg"), BackendType::SMB);
    EXPECT_EQ(protocol::classify("sftp://host/home/a.jpg"), BackendType::SFTP);
    EXPECT_EQ(protocol::classify("ftp://host/pub/a.jpg"), BackendType::FTP);
    EXPECT_EQ(protocol::classify("cloud://drive/photos/a.jpg"), BackendType::CLOUD);
    EXPECT_EQ(protocol::classify("content://tree/primary/a.jpg"), BackendType::SCOPED);
    EXPECT_EQ(protocol::classify("/home/user/a.jpg"), BackendType::LOCAL);
}

TEST(ProtocolClassifierTest, Classify_SftpIsNeverFtp) {
    EXPECT_EQ(protocol::classify("sftp://host/a"), BackendType::SFTP);
    EXPECT_EQ(protocol::classify("SFTP:/host/a"), BackendType::SFTP);
    EXPECT_EQ(protocol::classify("/sftp://host/a"), BackendType::SFTP);
    EXPECT_EQ(protocol::classify("ftp://host/a"), BackendType::FTP);
}

TEST(ProtocolClassifierTest, Classify_ToleratesSlashVariantsAndCase) {
    EXPECT_EQ(protocol::classify("smb:/nas/share"), BackendType::SMB);
    EXPECT_EQ(protocol::classify("/smb://nas/share"), BackendType::SMB);
    EXPECT_EQ(protocol::classify("SMB://nas/share"), BackendType::SMB);
    EXPECT_EQ(protocol::classify("Cloud://drive/x"), BackendType::CLOUD);
}

TEST(ProtocolClassifierTest, Classify_UnrecognizedIsLocal) {
    EXPECT_EQ(protocol::classify(""), BackendType::LOCAL);
    EXPECT_EQ(protocol::classify("relative/path.txt"), BackendType::LOCAL);
    EXPECT_EQ(protocol::classify("/data/smb/share"), BackendType::LOCAL);
    EXPECT_EQ(protocol::classify("smb"), BackendType::LOCAL);
    EXPECT_EQ(protocol::classify("smbx://nas"), BackendType::LOCAL);
    EXPECT_EQ(protocol::classify("http://example.com/a"), BackendType::LOCAL);
}

TEST(ProtocolClassifierTest, NormalizeLocator_ProducesCanonicalForm) {
    EXPECT_EQ(protocol::normalize_locator("smb:/nas/share/a"), "smb://nas/share/a");
    EXPECT_EQ(protocol::normalize_locator("/sftp://host/a"), "sftp://host/a");
    EXPECT_EQ(protocol::normalize_locator("SMB://nas/a"), "smb://nas/a");
    EXPECT_EQ(protocol::normalize_locator("/home/a"), "/home/a");
}

TEST(ProtocolClassifierTest, PathHelpers_WorkForLocalAndRemote) {
    EXPECT_EQ(protocol::file_name("/home/user/a.jpg"), "a.jpg");
    EXPECT_EQ(protocol::file_name("smb://nas/share/dir/a.jpg"), "a.jpg");
    EXPECT_EQ(protocol::file_name("smb://nas/share/dir/"), "dir");

    EXPECT_EQ(protocol::parent("/home/user/a.jpg"), "/home/user");
    EXPECT_EQ(protocol::parent("smb:/nas/share/a.jpg"), "smb://nas/share");

    EXPECT_EQ(protocol::join("/dst", "a.jpg"), "/dst/a.jpg");
    EXPECT_EQ(protocol::join("/dst/", "a.jpg"), "/dst/a.jpg");
    EXPECT_EQ(protocol::join("sftp://host/dir", "a.jpg"), "sftp://host/dir/a.jpg");

    EXPECT_EQ(protocol::replace_file_name("sftp://host/dir/a.jpg", "b.jpg"),
              "sftp://host/dir/b.jpg");
    EXPECT_EQ(protocol::replace_file_name("/home/a.jpg", "b.jpg"), "/home/b.jpg");
}

TEST(ProtocolClassifierTest, HostKey_SeparatesHosts) {
    EXPECT_EQ(protocol::host_key("smb://nas1/share/a"), "smb://nas1");
    EXPECT_EQ(protocol::host_key("smb:/nas2/share/a"), "smb://nas2");
    EXPECT_EQ(protocol::host_key("sftp://host:2222/a"), "sftp://host:2222");
    EXPECT_EQ(protocol::host_key("/home/a"), "local");
}

TEST(ProtocolClassifierTest, Memo_CachesAndClears) {
    ProtocolClassifier classifier;

    EXPECT_EQ(classifier.classify("smb://nas/a"), BackendType::SMB);
    EXPECT_EQ(classifier.classify("smb://nas/a"), BackendType::SMB);
    EXPECT_EQ(classifier.classify("/tmp/a"), BackendType::LOCAL);
    EXPECT_EQ(classifier.cached_entries(), 2u);

    classifier.clear();
    EXPECT_EQ(classifier.cached_entries(), 0u);
}

TEST(ProtocolClassifierTest, Memo_IsBounded) {
    ProtocolClassifier classifier(4);

    for (int i = 0; i < 10; ++i) {
        EXPECT_EQ(classifier.classify("ftp://host/" + std::to_string(i)), BackendType::FTP);
    }
    EXPECT_LE(classifier.cached_entries(), 4u);
}

TEST(ProtocolClassifierTest, Memo_IsThreadSafe) {
    ProtocolClassifier classifier(64);
    std::vector<std::thread> threads;
    std::atomic<int> mismatches{0};

    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&classifier, &mismatches, t]() {
            for (int i = 0; i < 200; ++i) {
                auto locator = (i % 2 == 0 ? "sftp://h/" : "/local/") + std::to_string(t * 1000 + i);
                auto expected = i % 2 == 0 ? BackendType::SFTP : BackendType::LOCAL;
                if (classifier.classify(locator) != expected) {
                    mismatches++;
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(mismatches.load(), 0);
}
