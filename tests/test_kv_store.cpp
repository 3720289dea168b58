/*
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 *
 * By contributing to this project, you agree to license your contributions
 * under the GPLv3 (or any later version) or any future licenses chosen by
 * the project author(s). Contributions include any modifications,
 * enhancements, or additions to the project. These contributions become
 * part of the project and are adopted by the project author(s).
 */

#include <gtest/gtest.h>
#include <stdio.h>
#include <stdlib.h>
#include <sys/stat.h>
#include <unistd.h>

#include <string>
#include <vector>

#include "storage/kv_store.h"

class JsonFileStoreTest : public ::testing::Test {
 protected:
   void SetUp() override {
      std::string pattern = ::testing::TempDir() + "ftv_store_XXXXXX";
      std::vector<char> buffer(pattern.begin(), pattern.end());
      buffer.push_back('\0');
      ASSERT_TRUE(mkdtemp(buffer.data()) != NULL);
      dir = buffer.data();
      path = dir + "/state/state.json";
   }

   void TearDown() override {
      unlink(path.c_str());
      unlink((path + ".tmp").c_str());
      rmdir((dir + "/state").c_str());
      rmdir(dir.c_str());
   }

   void write_file(const std::string &text) {
      mkdir((dir + "/state").c_str(), 0700);
      FILE *fp = fopen(path.c_str(), "w");
      ASSERT_TRUE(fp != NULL);
      fputs(text.c_str(), fp);
      fclose(fp);
   }

   std::string dir;
   std::string path;
};

TEST_F(JsonFileStoreTest, MissingFileLoadsEmpty) {
   JsonFileStore store(path);
   EXPECT_EQ(FTV_OK, store.load());

   std::string value;
   EXPECT_FALSE(store.get(STORE_KEY_HOST, &value));
}

TEST_F(JsonFileStoreTest, ValuesSurviveReload) {
   {
      JsonFileStore store(path);
      ASSERT_EQ(FTV_OK, store.load());
      EXPECT_EQ(FTV_OK, store.set(STORE_KEY_HOST, "10.0.0.5"));
      EXPECT_EQ(FTV_OK, store.set(STORE_KEY_CLIENT_TOKEN, "AB12CD34TOKEN"));
   }

   JsonFileStore reloaded(path);
   ASSERT_EQ(FTV_OK, reloaded.load());

   std::string value;
   ASSERT_TRUE(reloaded.get(STORE_KEY_HOST, &value));
   EXPECT_EQ("10.0.0.5", value);
   ASSERT_TRUE(reloaded.get(STORE_KEY_CLIENT_TOKEN, &value));
   EXPECT_EQ("AB12CD34TOKEN", value);
}

TEST_F(JsonFileStoreTest, EraseIsPersisted) {
   {
      JsonFileStore store(path);
      ASSERT_EQ(FTV_OK, store.load());
      ASSERT_EQ(FTV_OK, store.set(STORE_KEY_CLIENT_TOKEN, "secret"));
      EXPECT_EQ(FTV_OK, store.erase(STORE_KEY_CLIENT_TOKEN));
      EXPECT_EQ(FTV_OK, store.erase("never-set"));
   }

   JsonFileStore reloaded(path);
   ASSERT_EQ(FTV_OK, reloaded.load());
   EXPECT_FALSE(reloaded.get(STORE_KEY_CLIENT_TOKEN, NULL));
}

TEST_F(JsonFileStoreTest, FileIsPrivateToOwner) {
   JsonFileStore store(path);
   ASSERT_EQ(FTV_OK, store.load());
   ASSERT_EQ(FTV_OK, store.set(STORE_KEY_CLIENT_TOKEN, "secret"));

   struct stat st;
   ASSERT_EQ(0, stat(path.c_str(), &st));
   EXPECT_EQ(0600, st.st_mode & 0777);
}

TEST_F(JsonFileStoreTest, CorruptFileFailsToLoad) {
   write_file("{ this is not json");
   JsonFileStore store(path);
   EXPECT_EQ(FTV_ERR_IO, store.load());
}

TEST_F(JsonFileStoreTest, NonStringEntriesAreIgnored) {
   write_file("{\"host\": \"10.0.0.9\", \"count\": 3}");
   JsonFileStore store(path);
   ASSERT_EQ(FTV_OK, store.load());

   std::string value;
   ASSERT_TRUE(store.get(STORE_KEY_HOST, &value));
   EXPECT_EQ("10.0.0.9", value);
   EXPECT_FALSE(store.get("count", &value));
}
