#include "ob/tty.hh"

#include <gtest/gtest.h>

#include <fcntl.h>
#include <unistd.h>

#include <string>
#include <memory>
#include <stdexcept>

namespace
{

using Type = OB::Tty::Event::Type;

class InputTest : public ::testing::Test
{
protected:

  void SetUp() override
  {
    ASSERT_EQ(pipe(fds), 0);

    // raw mode reads return at once when nothing is buffered
    int const flags {fcntl(fds[0], F_GETFL)};
    ASSERT_NE(flags, -1);
    ASSERT_NE(fcntl(fds[0], F_SETFL, flags | O_NONBLOCK), -1);

    input = std::make_unique<OB::Tty::Input>(fds[0]);
  }

  void TearDown() override
  {
    input.reset();
    close(fds[0]);
    close(fds[1]);
  }

  void send(std::string const& bytes)
  {
    ASSERT_EQ(write(fds[1], bytes.data(), bytes.size()),
      static_cast<ssize_t>(bytes.size()));
  }

  // key of the next event, 0 if it was not a key
  char32_t next_key()
  {
    auto const ev = input->poll(0);

    if (ev.type != Type::key)
    {
      return 0;
    }

    return ev.key;
  }

  int fds[2] {-1, -1};
  std::unique_ptr<OB::Tty::Input> input;
};

} // namespace

TEST_F(InputTest, ArrowKeys)
{
  send("\x1b[A\x1b[B\x1b[C\x1b[D\x1bOA\x1bOD");

  EXPECT_EQ(next_key(), static_cast<char32_t>(OB::Tty::Key::up));
  EXPECT_EQ(next_key(), static_cast<char32_t>(OB::Tty::Key::down));
  EXPECT_EQ(next_key(), static_cast<char32_t>(OB::Tty::Key::right));
  EXPECT_EQ(next_key(), static_cast<char32_t>(OB::Tty::Key::left));
  EXPECT_EQ(next_key(), static_cast<char32_t>(OB::Tty::Key::up));
  EXPECT_EQ(next_key(), static_cast<char32_t>(OB::Tty::Key::left));
  EXPECT_EQ(input->poll(0).type, Type::timeout);
}

TEST_F(InputTest, HomeAndEndInEveryForm)
{
  send("\x1b[H\x1b[F\x1bOH\x1bOF\x1b[1~\x1b[4~\x1b[7~\x1b[8~\x1b[1;5~");

  EXPECT_EQ(next_key(), static_cast<char32_t>(OB::Tty::Key::home));
  EXPECT_EQ(next_key(), static_cast<char32_t>(OB::Tty::Key::end));
  EXPECT_EQ(next_key(), static_cast<char32_t>(OB::Tty::Key::home));
  EXPECT_EQ(next_key(), static_cast<char32_t>(OB::Tty::Key::end));
  EXPECT_EQ(next_key(), static_cast<char32_t>(OB::Tty::Key::home));
  EXPECT_EQ(next_key(), static_cast<char32_t>(OB::Tty::Key::end));
  EXPECT_EQ(next_key(), static_cast<char32_t>(OB::Tty::Key::home));
  EXPECT_EQ(next_key(), static_cast<char32_t>(OB::Tty::Key::end));
  EXPECT_EQ(next_key(), static_cast<char32_t>(OB::Tty::Key::home));
  EXPECT_EQ(input->poll(0).type, Type::timeout);
}

TEST_F(InputTest, UnknownSequenceIsDroppedWhole)
{
  send("\x1b[5~q");

  EXPECT_EQ(input->poll(0).type, Type::timeout);
  EXPECT_EQ(next_key(), U'q');

  send("\x1b[Zj");

  EXPECT_EQ(input->poll(0).type, Type::timeout);
  EXPECT_EQ(next_key(), U'j');
  EXPECT_EQ(input->poll(0).type, Type::timeout);
}

TEST_F(InputTest, LoneEscape)
{
  send("\x1b");

  EXPECT_EQ(next_key(), static_cast<char32_t>(OB::Tty::Key::escape));
}

TEST_F(InputTest, Utf8Characters)
{
  send("\xc3\xa9\xe6\x97\xa5k");

  EXPECT_EQ(next_key(), U'é');
  EXPECT_EQ(next_key(), U'日');
  EXPECT_EQ(next_key(), U'k');
}

TEST_F(InputTest, CtrlCInterrupts)
{
  send("\x03");

  auto const ev = input->poll(0);
  EXPECT_EQ(ev.type, Type::interrupt);
  EXPECT_EQ(ev.key, OB::Tty::ctrl_key('c'));
}

TEST_F(InputTest, ClosedInputInterrupts)
{
  close(fds[1]);
  fds[1] = -1;

  EXPECT_EQ(input->poll(0).type, Type::interrupt);
}

TEST(Input, OnlyOneAtATime)
{
  int fds[2] {-1, -1};
  ASSERT_EQ(pipe(fds), 0);

  {
    OB::Tty::Input input {fds[0]};
    EXPECT_THROW(OB::Tty::Input {fds[0]}, std::logic_error);
  }

  // released on destruction
  EXPECT_NO_THROW(OB::Tty::Input {fds[0]});

  close(fds[0]);
  close(fds[1]);
}
