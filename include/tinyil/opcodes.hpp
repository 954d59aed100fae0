#pragma once

#include <string_view>
#include <cstdint>

namespace tinyil
{

enum class flow_control : std::uint8_t
{
  next,
  branch,
  cond_branch,
  call,
  return_,
  throw_,
  break_,
  meta
};

enum class operand_kind : std::uint8_t
{
  none,
  short_branch,
  branch,
  switch_,
  int8,
  uint8,
  int32,
  int64,
  float32,
  float64,
  string,
  type,
  method,
  field,
  token,
  signature,
  short_arg,
  arg,
  short_local,
  local
};

// name, mnemonic, encoding (0xFExx for two byte opcodes), flow control, operand
#define TINYIL_OPCODES(X) \
  X(NOP,            "nop",            0x00,   next,        none) \
  X(BREAK,          "break",          0x01,   break_,      none) \
  X(LDARG_0,        "ldarg.0",        0x02,   next,        none) \
  X(LDARG_1,        "ldarg.1",        0x03,   next,        none) \
  X(LDARG_2,        "ldarg.2",        0x04,   next,        none) \
  X(LDARG_3,        "ldarg.3",        0x05,   next,        none) \
  X(LDLOC_0,        "ldloc.0",        0x06,   next,        none) \
  X(LDLOC_1,        "ldloc.1",        0x07,   next,        none) \
  X(LDLOC_2,        "ldloc.2",        0x08,   next,        none) \
  X(LDLOC_3,        "ldloc.3",        0x09,   next,        none) \
  X(STLOC_0,        "stloc.0",        0x0A,   next,        none) \
  X(STLOC_1,        "stloc.1",        0x0B,   next,        none) \
  X(STLOC_2,        "stloc.2",        0x0C,   next,        none) \
  X(STLOC_3,        "stloc.3",        0x0D,   next,        none) \
  X(LDARG_S,        "ldarg.s",        0x0E,   next,        short_arg) \
  X(LDARGA_S,       "ldarga.s",       0x0F,   next,        short_arg) \
  X(STARG_S,        "starg.s",        0x10,   next,        short_arg) \
  X(LDLOC_S,        "ldloc.s",        0x11,   next,        short_local) \
  X(LDLOCA_S,       "ldloca.s",       0x12,   next,        short_local) \
  X(STLOC_S,        "stloc.s",        0x13,   next,        short_local) \
  X(LDNULL,         "ldnull",         0x14,   next,        none) \
  X(LDC_I4_M1,      "ldc.i4.m1",      0x15,   next,        none) \
  X(LDC_I4_0,       "ldc.i4.0",       0x16,   next,        none) \
  X(LDC_I4_1,       "ldc.i4.1",       0x17,   next,        none) \
  X(LDC_I4_2,       "ldc.i4.2",       0x18,   next,        none) \
  X(LDC_I4_3,       "ldc.i4.3",       0x19,   next,        none) \
  X(LDC_I4_4,       "ldc.i4.4",       0x1A,   next,        none) \
  X(LDC_I4_5,       "ldc.i4.5",       0x1B,   next,        none) \
  X(LDC_I4_6,       "ldc.i4.6",       0x1C,   next,        none) \
  X(LDC_I4_7,       "ldc.i4.7",       0x1D,   next,        none) \
  X(LDC_I4_8,       "ldc.i4.8",       0x1E,   next,        none) \
  X(LDC_I4_S,       "ldc.i4.s",       0x1F,   next,        int8) \
  X(LDC_I4,         "ldc.i4",         0x20,   next,        int32) \
  X(LDC_I8,         "ldc.i8",         0x21,   next,        int64) \
  X(LDC_R4,         "ldc.r4",         0x22,   next,        float32) \
  X(LDC_R8,         "ldc.r8",         0x23,   next,        float64) \
  X(DUP,            "dup",            0x25,   next,        none) \
  X(POP,            "pop",            0x26,   next,        none) \
  X(JMP,            "jmp",            0x27,   call,        method) \
  X(CALL,           "call",           0x28,   call,        method) \
  X(CALLI,          "calli",          0x29,   call,        signature) \
  X(RET,            "ret",            0x2A,   return_,     none) \
  X(BR_S,           "br.s",           0x2B,   branch,      short_branch) \
  X(BRFALSE_S,      "brfalse.s",      0x2C,   cond_branch, short_branch) \
  X(BRTRUE_S,       "brtrue.s",       0x2D,   cond_branch, short_branch) \
  X(BEQ_S,          "beq.s",          0x2E,   cond_branch, short_branch) \
  X(BGE_S,          "bge.s",          0x2F,   cond_branch, short_branch) \
  X(BGT_S,          "bgt.s",          0x30,   cond_branch, short_branch) \
  X(BLE_S,          "ble.s",          0x31,   cond_branch, short_branch) \
  X(BLT_S,          "blt.s",          0x32,   cond_branch, short_branch) \
  X(BNE_UN_S,       "bne.un.s",       0x33,   cond_branch, short_branch) \
  X(BGE_UN_S,       "bge.un.s",       0x34,   cond_branch, short_branch) \
  X(BGT_UN_S,       "bgt.un.s",       0x35,   cond_branch, short_branch) \
  X(BLE_UN_S,       "ble.un.s",       0x36,   cond_branch, short_branch) \
  X(BLT_UN_S,       "blt.un.s",       0x37,   cond_branch, short_branch) \
  X(BR,             "br",             0x38,   branch,      branch) \
  X(BRFALSE,        "brfalse",        0x39,   cond_branch, branch) \
  X(BRTRUE,         "brtrue",         0x3A,   cond_branch, branch) \
  X(BEQ,            "beq",            0x3B,   cond_branch, branch) \
  X(BGE,            "bge",            0x3C,   cond_branch, branch) \
  X(BGT,            "bgt",            0x3D,   cond_branch, branch) \
  X(BLE,            "ble",            0x3E,   cond_branch, branch) \
  X(BLT,            "blt",            0x3F,   cond_branch, branch) \
  X(BNE_UN,         "bne.un",         0x40,   cond_branch, branch) \
  X(BGE_UN,         "bge.un",         0x41,   cond_branch, branch) \
  X(BGT_UN,         "bgt.un",         0x42,   cond_branch, branch) \
  X(BLE_UN,         "ble.un",         0x43,   cond_branch, branch) \
  X(BLT_UN,         "blt.un",         0x44,   cond_branch, branch) \
  X(SWITCH,         "switch",         0x45,   cond_branch, switch_) \
  X(LDIND_I1,       "ldind.i1",       0x46,   next,        none) \
  X(LDIND_U1,       "ldind.u1",       0x47,   next,        none) \
  X(LDIND_I2,       "ldind.i2",       0x48,   next,        none) \
  X(LDIND_U2,       "ldind.u2",       0x49,   next,        none) \
  X(LDIND_I4,       "ldind.i4",       0x4A,   next,        none) \
  X(LDIND_U4,       "ldind.u4",       0x4B,   next,        none) \
  X(LDIND_I8,       "ldind.i8",       0x4C,   next,        none) \
  X(LDIND_I,        "ldind.i",        0x4D,   next,        none) \
  X(LDIND_R4,       "ldind.r4",       0x4E,   next,        none) \
  X(LDIND_R8,       "ldind.r8",       0x4F,   next,        none) \
  X(LDIND_REF,      "ldind.ref",      0x50,   next,        none) \
  X(STIND_REF,      "stind.ref",      0x51,   next,        none) \
  X(STIND_I1,       "stind.i1",       0x52,   next,        none) \
  X(STIND_I2,       "stind.i2",       0x53,   next,        none) \
  X(STIND_I4,       "stind.i4",       0x54,   next,        none) \
  X(STIND_I8,       "stind.i8",       0x55,   next,        none) \
  X(STIND_R4,       "stind.r4",       0x56,   next,        none) \
  X(STIND_R8,       "stind.r8",       0x57,   next,        none) \
  X(ADD,            "add",            0x58,   next,        none) \
  X(SUB,            "sub",            0x59,   next,        none) \
  X(MUL,            "mul",            0x5A,   next,        none) \
  X(DIV,            "div",            0x5B,   next,        none) \
  X(DIV_UN,         "div.un",         0x5C,   next,        none) \
  X(REM,            "rem",            0x5D,   next,        none) \
  X(REM_UN,         "rem.un",         0x5E,   next,        none) \
  X(AND,            "and",            0x5F,   next,        none) \
  X(OR,             "or",             0x60,   next,        none) \
  X(XOR,            "xor",            0x61,   next,        none) \
  X(SHL,            "shl",            0x62,   next,        none) \
  X(SHR,            "shr",            0x63,   next,        none) \
  X(SHR_UN,         "shr.un",         0x64,   next,        none) \
  X(NEG,            "neg",            0x65,   next,        none) \
  X(NOT,            "not",            0x66,   next,        none) \
  X(CONV_I1,        "conv.i1",        0x67,   next,        none) \
  X(CONV_I2,        "conv.i2",        0x68,   next,        none) \
  X(CONV_I4,        "conv.i4",        0x69,   next,        none) \
  X(CONV_I8,        "conv.i8",        0x6A,   next,        none) \
  X(CONV_R4,        "conv.r4",        0x6B,   next,        none) \
  X(CONV_R8,        "conv.r8",        0x6C,   next,        none) \
  X(CONV_U4,        "conv.u4",        0x6D,   next,        none) \
  X(CONV_U8,        "conv.u8",        0x6E,   next,        none) \
  X(CALLVIRT,       "callvirt",       0x6F,   call,        method) \
  X(CPOBJ,          "cpobj",          0x70,   next,        type) \
  X(LDOBJ,          "ldobj",          0x71,   next,        type) \
  X(LDSTR,          "ldstr",          0x72,   next,        string) \
  X(NEWOBJ,         "newobj",         0x73,   call,        method) \
  X(CASTCLASS,      "castclass",      0x74,   next,        type) \
  X(ISINST,         "isinst",         0x75,   next,        type) \
  X(CONV_R_UN,      "conv.r.un",      0x76,   next,        none) \
  X(UNBOX,          "unbox",          0x79,   next,        type) \
  X(THROW,          "throw",          0x7A,   throw_,      none) \
  X(LDFLD,          "ldfld",          0x7B,   next,        field) \
  X(LDFLDA,         "ldflda",         0x7C,   next,        field) \
  X(STFLD,          "stfld",          0x7D,   next,        field) \
  X(LDSFLD,         "ldsfld",         0x7E,   next,        field) \
  X(LDSFLDA,        "ldsflda",        0x7F,   next,        field) \
  X(STSFLD,         "stsfld",         0x80,   next,        field) \
  X(STOBJ,          "stobj",          0x81,   next,        type) \
  X(CONV_OVF_I1_UN, "conv.ovf.i1.un", 0x82,   next,        none) \
  X(CONV_OVF_I2_UN, "conv.ovf.i2.un", 0x83,   next,        none) \
  X(CONV_OVF_I4_UN, "conv.ovf.i4.un", 0x84,   next,        none) \
  X(CONV_OVF_I8_UN, "conv.ovf.i8.un", 0x85,   next,        none) \
  X(CONV_OVF_U1_UN, "conv.ovf.u1.un", 0x86,   next,        none) \
  X(CONV_OVF_U2_UN, "conv.ovf.u2.un", 0x87,   next,        none) \
  X(CONV_OVF_U4_UN, "conv.ovf.u4.un", 0x88,   next,        none) \
  X(CONV_OVF_U8_UN, "conv.ovf.u8.un", 0x89,   next,        none) \
  X(CONV_OVF_I_UN,  "conv.ovf.i.un",  0x8A,   next,        none) \
  X(CONV_OVF_U_UN,  "conv.ovf.u.un",  0x8B,   next,        none) \
  X(BOX,            "box",            0x8C,   next,        type) \
  X(NEWARR,         "newarr",         0x8D,   next,        type) \
  X(LDLEN,          "ldlen",          0x8E,   next,        none) \
  X(LDELEMA,        "ldelema",        0x8F,   next,        type) \
  X(LDELEM_I1,      "ldelem.i1",      0x90,   next,        none) \
  X(LDELEM_U1,      "ldelem.u1",      0x91,   next,        none) \
  X(LDELEM_I2,      "ldelem.i2",      0x92,   next,        none) \
  X(LDELEM_U2,      "ldelem.u2",      0x93,   next,        none) \
  X(LDELEM_I4,      "ldelem.i4",      0x94,   next,        none) \
  X(LDELEM_U4,      "ldelem.u4",      0x95,   next,        none) \
  X(LDELEM_I8,      "ldelem.i8",      0x96,   next,        none) \
  X(LDELEM_I,       "ldelem.i",       0x97,   next,        none) \
  X(LDELEM_R4,      "ldelem.r4",      0x98,   next,        none) \
  X(LDELEM_R8,      "ldelem.r8",      0x99,   next,        none) \
  X(LDELEM_REF,     "ldelem.ref",     0x9A,   next,        none) \
  X(STELEM_I,       "stelem.i",       0x9B,   next,        none) \
  X(STELEM_I1,      "stelem.i1",      0x9C,   next,        none) \
  X(STELEM_I2,      "stelem.i2",      0x9D,   next,        none) \
  X(STELEM_I4,      "stelem.i4",      0x9E,   next,        none) \
  X(STELEM_I8,      "stelem.i8",      0x9F,   next,        none) \
  X(STELEM_R4,      "stelem.r4",      0xA0,   next,        none) \
  X(STELEM_R8,      "stelem.r8",      0xA1,   next,        none) \
  X(STELEM_REF,     "stelem.ref",     0xA2,   next,        none) \
  X(LDELEM_ANY,     "ldelem",         0xA3,   next,        type) \
  X(STELEM_ANY,     "stelem",         0xA4,   next,        type) \
  X(UNBOX_ANY,      "unbox.any",      0xA5,   next,        type) \
  X(CONV_OVF_I1,    "conv.ovf.i1",    0xB3,   next,        none) \
  X(CONV_OVF_U1,    "conv.ovf.u1",    0xB4,   next,        none) \
  X(CONV_OVF_I2,    "conv.ovf.i2",    0xB5,   next,        none) \
  X(CONV_OVF_U2,    "conv.ovf.u2",    0xB6,   next,        none) \
  X(CONV_OVF_I4,    "conv.ovf.i4",    0xB7,   next,        none) \
  X(CONV_OVF_U4,    "conv.ovf.u4",    0xB8,   next,        none) \
  X(CONV_OVF_I8,    "conv.ovf.i8",    0xB9,   next,        none) \
  X(CONV_OVF_U8,    "conv.ovf.u8",    0xBA,   next,        none) \
  X(REFANYVAL,      "refanyval",      0xC2,   next,        type) \
  X(CKFINITE,       "ckfinite",       0xC3,   next,        none) \
  X(MKREFANY,       "mkrefany",       0xC6,   next,        type) \
  X(LDTOKEN,        "ldtoken",        0xD0,   next,        token) \
  X(CONV_U2,        "conv.u2",        0xD1,   next,        none) \
  X(CONV_U1,        "conv.u1",        0xD2,   next,        none) \
  X(CONV_I,         "conv.i",         0xD3,   next,        none) \
  X(CONV_OVF_I,     "conv.ovf.i",     0xD4,   next,        none) \
  X(CONV_OVF_U,     "conv.ovf.u",     0xD5,   next,        none) \
  X(ADD_OVF,        "add.ovf",        0xD6,   next,        none) \
  X(ADD_OVF_UN,     "add.ovf.un",     0xD7,   next,        none) \
  X(MUL_OVF,        "mul.ovf",        0xD8,   next,        none) \
  X(MUL_OVF_UN,     "mul.ovf.un",     0xD9,   next,        none) \
  X(SUB_OVF,        "sub.ovf",        0xDA,   next,        none) \
  X(SUB_OVF_UN,     "sub.ovf.un",     0xDB,   next,        none) \
  X(ENDFINALLY,     "endfinally",     0xDC,   return_,     none) \
  X(LEAVE,          "leave",          0xDD,   branch,      branch) \
  X(LEAVE_S,        "leave.s",        0xDE,   branch,      short_branch) \
  X(STIND_I,        "stind.i",        0xDF,   next,        none) \
  X(CONV_U,         "conv.u",         0xE0,   next,        none) \
  X(ARGLIST,        "arglist",        0xFE00, next,        none) \
  X(CEQ,            "ceq",            0xFE01, next,        none) \
  X(CGT,            "cgt",            0xFE02, next,        none) \
  X(CGT_UN,         "cgt.un",         0xFE03, next,        none) \
  X(CLT,            "clt",            0xFE04, next,        none) \
  X(CLT_UN,         "clt.un",         0xFE05, next,        none) \
  X(LDFTN,          "ldftn",          0xFE06, next,        method) \
  X(LDVIRTFTN,      "ldvirtftn",      0xFE07, next,        method) \
  X(LDARG,          "ldarg",          0xFE09, next,        arg) \
  X(LDARGA,         "ldarga",         0xFE0A, next,        arg) \
  X(STARG,          "starg",          0xFE0B, next,        arg) \
  X(LDLOC,          "ldloc",          0xFE0C, next,        local) \
  X(LDLOCA,         "ldloca",         0xFE0D, next,        local) \
  X(STLOC,          "stloc",          0xFE0E, next,        local) \
  X(LOCALLOC,       "localloc",       0xFE0F, next,        none) \
  X(ENDFILTER,      "endfilter",      0xFE11, return_,     none) \
  X(UNALIGNED,      "unaligned.",     0xFE12, meta,        uint8) \
  X(VOLATILE,       "volatile.",      0xFE13, meta,        none) \
  X(TAIL,           "tail.",          0xFE14, meta,        none) \
  X(INITOBJ,        "initobj",        0xFE15, next,        type) \
  X(CONSTRAINED,    "constrained.",   0xFE16, meta,        type) \
  X(CPBLK,          "cpblk",          0xFE17, next,        none) \
  X(INITBLK,        "initblk",        0xFE18, next,        none) \
  X(RETHROW,        "rethrow",        0xFE1A, throw_,      none) \
  X(SIZEOF,         "sizeof",         0xFE1C, next,        type) \
  X(REFANYTYPE,     "refanytype",     0xFE1D, next,        none) \
  X(READONLY,       "readonly.",      0xFE1E, meta,        none)

enum class op_code : std::uint16_t
{
#define TINYIL_OPCODE_ENUM(name, mnemonic, value, flow, operand) name,
  TINYIL_OPCODES(TINYIL_OPCODE_ENUM)
#undef TINYIL_OPCODE_ENUM
  UNKNOWN
};

struct opcode_info
{
  std::string_view mnemonic;
  std::uint16_t value;
  flow_control flow;
  operand_kind operand;

  constexpr bool is_two_byte() const
  { return value > 0xFF; }

  constexpr std::size_t size() const
  { return is_two_byte() ? 2 : 1; }
};

const opcode_info& info(op_code op);

std::size_t operand_size(operand_kind kind);

inline std::string_view mnemonic(op_code op)
{ return info(op).mnemonic; }

}
